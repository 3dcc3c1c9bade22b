#pragma once

#include "concurrency/AsyncService.hpp"
#include "cache/Context.hpp"
#include "types/Entry.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace tt::cache {

class Scheduler;

/**
 * @brief Per-key timers for user-triggered requests.
 *
 * A repeat request before expiry replaces the key's deadline, so a burst of
 * requests collapses into one. On expiry the key goes to the front of the
 * work queue and the scheduler is asked to drain.
 */
class Debouncer final : public concurrency::AsyncService {
public:
    Debouncer(Context& ctx, Scheduler& scheduler);
    ~Debouncer() override;

    void requestImmediate(const std::string& key, types::Clock::time_point now = types::Clock::now());

    // Queues every key whose deadline has passed. Returns how many were queued.
    std::size_t fireDue(types::Clock::time_point now);

    bool cancel(const std::string& key);
    void clear();

    [[nodiscard]] std::size_t pendingCount() const;

protected:
    void runLoop() override;

private:
    Context& ctx_;
    Scheduler& scheduler_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, types::Clock::time_point> deadlines_;
};

}
