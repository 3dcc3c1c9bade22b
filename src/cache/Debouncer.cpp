#include "cache/Debouncer.hpp"
#include "cache/Scheduler.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <vector>

using namespace tt::cache;
using namespace tt::types;

namespace {
constexpr std::chrono::milliseconds IDLE_WAIT{1000};
}

Debouncer::Debouncer(Context& ctx, Scheduler& scheduler)
    : AsyncService("Debouncer"), ctx_(ctx), scheduler_(scheduler) {}

Debouncer::~Debouncer() {
    stop();
}

void Debouncer::requestImmediate(const std::string& key, const Clock::time_point now) {
    if (key.empty()) return;

    auto window = ctx_.config()->debounce_window;
    if (ctx_.isBusy()) window *= 2;

    {
        std::scoped_lock lock(mutex_);
        deadlines_.insert_or_assign(key, now + window);
    }
    wake();
}

std::size_t Debouncer::fireDue(const Clock::time_point now) {
    std::vector<std::string> due; {
        std::scoped_lock lock(mutex_);
        for (auto it = deadlines_.begin(); it != deadlines_.end();) {
            if (it->second <= now) {
                due.push_back(it->first);
                it = deadlines_.erase(it);
            } else ++it;
        }
    }
    if (due.empty()) return 0;

    std::size_t queued = 0; {
        std::scoped_lock lock(ctx_.mutex);
        for (const auto& key : due) {
            if (ctx_.processing.contains(key)) continue;
            ctx_.queue.pushFront(key);
            ++queued;
        }
    }

    if (queued) {
        log::Registry::scheduler()->debug("[Debouncer] {} request(s) moved to the front of the queue", queued);
        scheduler_.requestDrain();
    }
    return queued;
}

bool Debouncer::cancel(const std::string& key) {
    std::scoped_lock lock(mutex_);
    return deadlines_.erase(key) > 0;
}

void Debouncer::clear() {
    std::scoped_lock lock(mutex_);
    deadlines_.clear();
}

std::size_t Debouncer::pendingCount() const {
    std::scoped_lock lock(mutex_);
    return deadlines_.size();
}

void Debouncer::runLoop() {
    while (!shouldStop()) {
        std::chrono::steady_clock::duration wait = IDLE_WAIT; {
            std::scoped_lock lock(mutex_);
            if (!deadlines_.empty()) {
                const auto next = std::ranges::min_element(deadlines_, {}, [](const auto& kv) { return kv.second; });
                wait = std::max<std::chrono::steady_clock::duration>(next->second - Clock::now(),
                                                                    std::chrono::steady_clock::duration::zero());
            }
        }
        lazySleep(wait);
        if (shouldStop()) break;
        fireDue(Clock::now());
    }
}
