#include "cache/WorkQueue.hpp"

#include <algorithm>

using namespace tt::cache;

WorkQueue::Push WorkQueue::pushBack(const std::string& key) {
    if (members_.contains(key)) return Push::Duplicate;
    if (order_.size() >= maxLength_) return Push::Dropped;
    order_.push_back(key);
    members_.insert(key);
    return Push::Added;
}

WorkQueue::Push WorkQueue::pushFront(const std::string& key) {
    if (members_.contains(key)) {
        if (!order_.empty() && order_.front() == key) return Push::Duplicate;
        order_.erase(std::ranges::find(order_, key));
        order_.push_front(key);
        return Push::Promoted;
    }
    order_.push_front(key);
    members_.insert(key);
    return Push::Added;
}

std::vector<std::string> WorkQueue::popFront(const std::size_t n) {
    std::vector<std::string> out;
    out.reserve(std::min(n, order_.size()));
    while (out.size() < n && !order_.empty()) {
        members_.erase(order_.front());
        out.push_back(std::move(order_.front()));
        order_.pop_front();
    }
    return out;
}

bool WorkQueue::remove(const std::string& key) {
    if (!members_.erase(key)) return false;
    order_.erase(std::ranges::find(order_, key));
    return true;
}

void WorkQueue::clear() {
    order_.clear();
    members_.clear();
}
