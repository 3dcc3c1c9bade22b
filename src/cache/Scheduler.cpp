#include "cache/Scheduler.hpp"
#include "cache/Processor.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace tt::cache;
using namespace tt::types;
using namespace tt::config;
using namespace std::chrono;

Scheduler::Scheduler(Context& ctx, Processor& processor)
    : AsyncService("Scheduler"), ctx_(ctx), processor_(processor),
      intervalMs_(ctx.config()->tick_interval.count()) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    {
        std::scoped_lock lock(tickMutex_);
        lastSweep_ = Clock::now();
    }
    AsyncService::start();
    log::Registry::scheduler()->info("[Scheduler] Started (interval: {}ms)", currentInterval().count());
}

void Scheduler::resetInterval() {
    std::scoped_lock lock(tickMutex_);
    intervalMs_.store(ctx_.config()->tick_interval.count());
    consecutiveEmpty_ = 0;
}

Scheduler::TickResult Scheduler::tick(const Clock::time_point now) {
    std::scoped_lock tickLock(tickMutex_);
    ctx_.stats.record_tick();

    const auto cfg = ctx_.config();
    const auto governor = ctx_.governor();

    if (governor->hostBusy()) {
        ctx_.stats.record_busy_skip();
        std::size_t queued; {
            std::scoped_lock lock(ctx_.mutex);
            queued = ctx_.queue.size();
        }
        adapt(queued, true, *cfg);
        log::Registry::scheduler()->debug("[Scheduler] Host busy, skipping tick ({} queued)", queued);
        return {TickState::Busy, 0, {}};
    }

    if (lastDrain_ && now - *lastDrain_ < cfg->min_tick_interval)
        return {TickState::Throttled, 0, duration_cast<milliseconds>(cfg->min_tick_interval - (now - *lastDrain_))};

    std::vector<std::string> batch;
    std::size_t remaining; {
        std::scoped_lock lock(ctx_.mutex);
        const auto queued = ctx_.queue.size();
        if (queued == 0) {
            ++consecutiveEmpty_;
            adapt(0, false, *cfg);
            return {TickState::Empty, 0, {}};
        }
        consecutiveEmpty_ = 0;

        const auto n = std::min({cfg->max_batch_per_tick, queued, governor->spareCapacity(ctx_.processing.size())});
        if (n == 0) return {TickState::NoCapacity, 0, {}};

        batch = ctx_.queue.popFront(n);
        remaining = ctx_.queue.size();
    }

    lastDrain_ = now;
    if (remaining > cfg->queue_pressure_threshold)
        log::Registry::scheduler()->warn("[Scheduler] Backlog of {} files after dispatching {}", remaining, batch.size());

    for (const auto& key : batch) {
        try {
            (void)processor_.process(key);
        } catch (const std::exception& e) {
            log::Registry::scheduler()->error("[Scheduler] Failed to dispatch {}: {}", key, e.what());
        }
    }

    adapt(remaining, false, *cfg);
    return {TickState::Drained, batch.size(), {}};
}

void Scheduler::adapt(const std::size_t queueSize, const bool busy, const CacheConfig& cfg) {
    if (!cfg.adaptive_scheduling) {
        intervalMs_.store(cfg.tick_interval.count());
        return;
    }

    const auto current = intervalMs_.load();
    auto next = current;
    const auto lo = cfg.min_tick_interval.count();
    const auto hi = cfg.max_tick_interval.count();

    if (queueSize > cfg.queue_pressure_threshold) next = std::min(current * 2, hi);
    else if (busy) next = std::min(current * 3 / 2, hi);
    else if (consecutiveEmpty_ > cfg.idle_ticks_before_speedup) next = std::max(current * 4 / 5, lo);

    next = std::clamp(next, lo, hi);
    if (next != current) {
        intervalMs_.store(next);
        log::Registry::scheduler()->debug("[Scheduler] Interval {}ms -> {}ms", current, next);
    }
}

void Scheduler::runLoop() {
    auto wait = currentInterval();
    while (!shouldStop()) {
        lazySleep(wait);
        if (shouldStop()) break;

        const auto now = Clock::now();
        wait = currentInterval();

        try {
            const auto result = tick(now);
            wait = result.state == TickState::Throttled ? std::max(result.retryIn, milliseconds(1)) : currentInterval();

            const auto sweepInterval = ctx_.config()->sweep_interval;
            bool sweepDue = false; {
                std::scoped_lock lock(tickMutex_);
                if (now - lastSweep_ >= sweepInterval) {
                    lastSweep_ = now;
                    sweepDue = true;
                }
            }
            if (sweepDue) ctx_.sweep(now);
        } catch (const std::exception& e) {
            log::Registry::scheduler()->error("[Scheduler] Tick failed: {}", e.what());
        }
    }
}

std::string tt::cache::to_string(const Scheduler::TickState state) {
    switch (state) {
        case Scheduler::TickState::Drained: return "drained";
        case Scheduler::TickState::Throttled: return "throttled";
        case Scheduler::TickState::Empty: return "empty";
        case Scheduler::TickState::Busy: return "busy";
        case Scheduler::TickState::NoCapacity: return "no_capacity";
    }
    return "unknown";
}
