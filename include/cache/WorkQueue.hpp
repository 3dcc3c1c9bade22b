#pragma once

#include <deque>
#include <string>
#include <unordered_set>
#include <vector>

namespace tt::cache {

// Ordered, de-duplicated backlog of keys. Not synchronized; guarded by Context::mutex.
class WorkQueue {
public:
    enum class Push { Added, Promoted, Duplicate, Dropped };

    explicit WorkQueue(std::size_t maxLength = 50) : maxLength_(maxLength) {}

    // Background discovery: appended, unless already queued or the queue is full.
    Push pushBack(const std::string& key);

    // User-triggered: always accepted; an already queued key moves to the front.
    Push pushFront(const std::string& key);

    std::vector<std::string> popFront(std::size_t n);

    bool remove(const std::string& key);

    void clear();

    [[nodiscard]] bool contains(const std::string& key) const { return members_.contains(key); }
    [[nodiscard]] std::size_t size() const { return order_.size(); }
    [[nodiscard]] bool empty() const { return order_.empty(); }
    [[nodiscard]] std::size_t maxLength() const { return maxLength_; }

    void setMaxLength(std::size_t maxLength) { maxLength_ = maxLength; }

private:
    std::deque<std::string> order_;
    std::unordered_set<std::string> members_;
    std::size_t maxLength_;
};

}
