#include "notify/NotificationBatcher.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace tt::notify;
using namespace tt::types;

namespace {
constexpr std::chrono::milliseconds IDLE_WAIT{1000};
}

NotificationBatcher::NotificationBatcher(const std::chrono::milliseconds window)
    : AsyncService("NotificationBatcher"), window_(window) {}

NotificationBatcher::~NotificationBatcher() {
    stop();
}

NotificationBatcher::SubscriptionId NotificationBatcher::subscribe(Callback callback) {
    if (!callback) throw std::invalid_argument("NotificationBatcher::subscribe requires a callable");
    std::scoped_lock lock(mutex_);
    const auto id = nextId_++;
    subscribers_.emplace_back(id, std::move(callback));
    return id;
}

bool NotificationBatcher::unsubscribe(const SubscriptionId id) {
    std::scoped_lock lock(mutex_);
    return std::erase_if(subscribers_, [id](const auto& s) { return s.first == id; }) > 0;
}

void NotificationBatcher::notifyUpdated(const std::string& key, const EntryKind kind, const Clock::time_point now) {
    bool opened = false; {
        std::scoped_lock lock(mutex_);
        pending_.push_back({key, kind});
        if (!openedAt_) {
            openedAt_ = now;
            opened = true;
        }
    }
    if (opened) wake();
}

bool NotificationBatcher::flushDue(const Clock::time_point now) {
    std::vector<Event> batch; {
        std::scoped_lock lock(mutex_);
        if (!openedAt_ || now - *openedAt_ < window_) return false;
        batch = takePendingLocked();
    }
    deliver(batch);
    return true;
}

bool NotificationBatcher::flush() {
    std::vector<Event> batch; {
        std::scoped_lock lock(mutex_);
        if (pending_.empty()) return false;
        batch = takePendingLocked();
    }
    deliver(batch);
    return true;
}

void NotificationBatcher::setWindow(const std::chrono::milliseconds window) {
    std::scoped_lock lock(mutex_);
    window_ = window;
}

std::size_t NotificationBatcher::pendingCount() const {
    std::scoped_lock lock(mutex_);
    return pending_.size();
}

std::size_t NotificationBatcher::subscriberCount() const {
    std::scoped_lock lock(mutex_);
    return subscribers_.size();
}

void NotificationBatcher::runLoop() {
    while (!shouldStop()) {
        std::chrono::steady_clock::duration wait = IDLE_WAIT; {
            std::scoped_lock lock(mutex_);
            if (openedAt_) wait = std::max<std::chrono::steady_clock::duration>(
                                 *openedAt_ + window_ - Clock::now(), std::chrono::steady_clock::duration::zero());
        }
        lazySleep(wait);
        if (shouldStop()) break;
        flushDue(Clock::now());
    }
}

std::vector<NotificationBatcher::Event> NotificationBatcher::takePendingLocked() {
    std::vector<Event> batch;
    batch.swap(pending_);
    openedAt_.reset();
    return batch;
}

void NotificationBatcher::deliver(const std::vector<Event>& batch) {
    if (batch.empty()) return;

    decltype(subscribers_) subscribers; {
        std::scoped_lock lock(mutex_);
        subscribers = subscribers_;
    }

    const auto& first = batch.front();
    log::Registry::notify()->debug("[NotificationBatcher] Flushing {} events to {} subscribers",
                                   batch.size(), subscribers.size());

    for (const auto& [id, callback] : subscribers) {
        try {
            callback(first.key, first.kind);
        } catch (const std::exception& e) {
            log::Registry::notify()->error("[NotificationBatcher] Subscriber {} failed: {}", id, e.what());
        } catch (...) {
            log::Registry::notify()->error("[NotificationBatcher] Subscriber {} failed with an unknown error", id);
        }
    }
}
