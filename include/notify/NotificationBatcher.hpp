#pragma once

#include "concurrency/AsyncService.hpp"
#include "types/Entry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tt::notify {

/**
 * @brief Coalesces "entry updated" events into one delivery per window.
 *
 * The window opens with the first pending event and closes
 * `window` later; every subscriber then sees the first event of the batch
 * exactly once. Subscribers run on the batcher's own thread (or the thread
 * calling flush()), never on a processor worker.
 */
class NotificationBatcher final : public concurrency::AsyncService {
public:
    using Callback = std::function<void(const std::string& key, types::EntryKind kind)>;
    using SubscriptionId = uint64_t;

    struct Event {
        std::string key;
        types::EntryKind kind;
    };

    explicit NotificationBatcher(std::chrono::milliseconds window);
    ~NotificationBatcher() override;

    SubscriptionId subscribe(Callback callback);
    bool unsubscribe(SubscriptionId id);

    void notifyUpdated(const std::string& key, types::EntryKind kind,
                       types::Clock::time_point now = types::Clock::now());

    // Delivers the pending batch if its window has closed. True if delivered.
    bool flushDue(types::Clock::time_point now);

    // Delivers the pending batch regardless of the window.
    bool flush();

    void setWindow(std::chrono::milliseconds window);

    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] std::size_t subscriberCount() const;

protected:
    void runLoop() override;

private:
    std::vector<Event> takePendingLocked();
    void deliver(const std::vector<Event>& batch);

    mutable std::mutex mutex_;
    std::vector<Event> pending_;
    std::optional<types::Clock::time_point> openedAt_;
    std::chrono::milliseconds window_;

    std::vector<std::pair<SubscriptionId, Callback>> subscribers_;
    SubscriptionId nextId_ = 1;
};

}
