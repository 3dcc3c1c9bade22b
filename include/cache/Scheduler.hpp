#pragma once

#include "concurrency/AsyncService.hpp"
#include "cache/Context.hpp"
#include "types/Entry.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace tt::cache {

class Processor;

/**
 * @brief Periodic driver that drains the work queue into the processor.
 *
 * Each tick pulls min(max_batch_per_tick, queue length, spare capacity)
 * keys from the front of the queue. tick() is serialized so two ticks never
 * overlap, and a tick arriving within min_tick_interval of the last drain is
 * a no-op. With adaptive scheduling the wait between ticks stretches under
 * queue pressure or a busy host and shrinks after a run of idle ticks.
 */
class Scheduler final : public concurrency::AsyncService {
public:
    enum class TickState { Drained, Throttled, Empty, Busy, NoCapacity };

    struct TickResult {
        TickState state = TickState::Empty;
        std::size_t dispatched = 0;
        std::chrono::milliseconds retryIn{0};   // set when throttled
    };

    Scheduler(Context& ctx, Processor& processor);
    ~Scheduler() override;

    TickResult tick(types::Clock::time_point now);

    // Wakes the loop so the queue is looked at now instead of after the interval.
    void requestDrain() { wake(); }

    [[nodiscard]] std::chrono::milliseconds currentInterval() const {
        return std::chrono::milliseconds(intervalMs_.load());
    }

    // Back to the configured tick_interval; used after a config change.
    void resetInterval();

    void start() override;

protected:
    void runLoop() override;

private:
    void adapt(std::size_t queueSize, bool busy, const config::CacheConfig& cfg);

    Context& ctx_;
    Processor& processor_;

    std::mutex tickMutex_;
    std::optional<types::Clock::time_point> lastDrain_;
    unsigned int consecutiveEmpty_ = 0;
    types::Clock::time_point lastSweep_{};

    std::atomic<int64_t> intervalMs_;
};

std::string to_string(Scheduler::TickState state);

}
