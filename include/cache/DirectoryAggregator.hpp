#pragma once

#include "cache/Context.hpp"
#include "concurrency/ThreadPool.hpp"

#include <cstdint>
#include <future>
#include <string>
#include <vector>

namespace tt::notify { class NotificationBatcher; }

namespace tt::cache {

class Processor;

struct DirectoryResult {
    uint64_t sum = 0;
    std::size_t counted = 0;     // children that contributed a value
    std::size_t reused = 0;      // of those, served from fresh cache entries
    std::size_t skipped = 0;     // ineligible or failed, contributed zero
    std::string error;           // set when the directory itself could not be aggregated

    [[nodiscard]] bool ok() const { return error.empty(); }
};

/**
 * @brief Sums the counts of a directory's eligible children.
 *
 * Fresh child entries are reused as they are; everything else goes through
 * the processor. Recursive scans never descend into dot-directories.
 */
class DirectoryAggregator {
public:
    DirectoryAggregator(Context& ctx, Processor& processor, notify::NotificationBatcher& batcher,
                        unsigned int workerThreads = 1);

    ~DirectoryAggregator();

    DirectoryAggregator(const DirectoryAggregator&) = delete;
    DirectoryAggregator& operator=(const DirectoryAggregator&) = delete;

    std::future<DirectoryResult> computeDirectory(const std::string& path, bool recursive = false);

    // Background discovery: appends stale or missing eligible children to the
    // back of the queue. Returns how many were added.
    std::size_t queueDirectory(const std::string& path, bool recursive = false);

    void stop();

    // Worker side of computeDirectory(); expects the directory key to be claimed.
    DirectoryResult aggregate(const std::string& path, bool recursive);

    DirectoryResult abandon(const std::string& path);

private:
    // Eligible child files by name; throws std::filesystem::filesystem_error
    // when the directory itself cannot be read.
    [[nodiscard]] std::vector<std::string> eligibleChildren(const std::string& path, bool recursive) const;

    Context& ctx_;
    Processor& processor_;
    notify::NotificationBatcher& batcher_;
    concurrency::ThreadPool pool_;
};

}
