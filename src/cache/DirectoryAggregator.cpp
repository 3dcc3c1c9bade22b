#include "cache/DirectoryAggregator.hpp"
#include "cache/Processor.hpp"
#include "concurrency/DirectoryTask.hpp"
#include "notify/NotificationBatcher.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <utility>

using namespace tt::cache;
using namespace tt::types;
using Verdict = Governor::Verdict;

namespace fs = std::filesystem;

DirectoryAggregator::DirectoryAggregator(Context& ctx, Processor& processor,
                                         notify::NotificationBatcher& batcher, const unsigned int workerThreads)
    : ctx_(ctx), processor_(processor), batcher_(batcher), pool_("directory", workerThreads) {}

DirectoryAggregator::~DirectoryAggregator() {
    stop();
}

void DirectoryAggregator::stop() {
    pool_.stop();
}

std::future<DirectoryResult> DirectoryAggregator::computeDirectory(const std::string& path, const bool recursive) {
    if (path.empty() || !ctx_.tryClaim(path)) {
        std::promise<DirectoryResult> p;
        DirectoryResult result;
        result.error = path.empty() ? "empty path" : "already processing";
        p.set_value(std::move(result));
        return p.get_future();
    }

    const auto task = std::make_shared<concurrency::DirectoryTask>(*this, path, recursive);
    auto future = task->getFuture();
    if (!pool_.submit(task)) task->cancel();
    return future;
}

DirectoryResult DirectoryAggregator::aggregate(const std::string& path, const bool recursive) {
    const auto started = Clock::now();
    const auto cfg = ctx_.config();

    DirectoryResult result;
    try {
        const auto children = eligibleChildren(path, recursive);
        const auto now = Clock::now();
        bool approximate = false;

        const auto add = [&](const CacheEntry& entry) {
            result.sum += *entry.value;
            ++result.counted;
            if (entry.status != EntryStatus::Ready) approximate = true;
        };

        std::vector<std::pair<std::string, std::future<ProcessResult>>> pending;
        for (const auto& child : children) {
            std::optional<CacheEntry> cached; {
                std::scoped_lock lock(ctx_.mutex);
                cached = ctx_.store.get(child);
            }
            if (cached && cached->isFreshCount(now, cfg->ttl_file)) {
                add(*cached);
                ++result.reused;
                continue;
            }
            pending.emplace_back(child, processor_.process(child));
        }

        for (auto& [child, future] : pending) {
            ProcessResult outcome;
            try {
                outcome = future.get();
            } catch (const std::future_error& e) {
                log::Registry::cache()->warn("[DirectoryAggregator] Lost result for {}: {}", child, e.what());
                ++result.skipped;
                continue;
            }

            if (outcome.outcome == ProcessResult::Outcome::AlreadyProcessing) {
                // Someone else is counting it; whatever value the store holds is the best we have.
                std::scoped_lock lock(ctx_.mutex);
                outcome.entry = ctx_.store.get(child);
            }

            if (outcome.entry && outcome.entry->hasValue()) add(*outcome.entry);
            else ++result.skipped;
        }

        auto entry = CacheEntry::make(path, EntryKind::Directory,
                                      approximate ? EntryStatus::Estimated : EntryStatus::Ready,
                                      result.sum, Clock::now()); {
            std::scoped_lock lock(ctx_.mutex);
            ctx_.store.put(std::move(entry));
            ctx_.processing.erase(path);
        }
    } catch (const std::exception& e) {
        ctx_.release(path);
        log::Registry::cache()->warn("[DirectoryAggregator] Failed to aggregate {}: {}", path, e.what());
        DirectoryResult failed;
        failed.error = e.what();
        return failed;
    }

    ctx_.stats.record_op_us(static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - started).count()));
    batcher_.notifyUpdated(path, EntryKind::Directory);

    log::Registry::cache()->debug("[DirectoryAggregator] {} = {} ({} counted, {} reused, {} skipped)",
                                  path, result.sum, result.counted, result.reused, result.skipped);
    return result;
}

DirectoryResult DirectoryAggregator::abandon(const std::string& path) {
    ctx_.release(path);
    DirectoryResult result;
    result.error = "aggregator stopped";
    return result;
}

std::size_t DirectoryAggregator::queueDirectory(const std::string& path, const bool recursive) {
    std::vector<std::string> children;
    try {
        children = eligibleChildren(path, recursive);
    } catch (const std::exception& e) {
        log::Registry::cache()->debug("[DirectoryAggregator] Cannot scan {}: {}", path, e.what());
        return 0;
    }

    const auto ttl = ctx_.config()->ttl_file;
    const auto now = Clock::now();
    std::size_t added = 0, dropped = 0; {
        std::scoped_lock lock(ctx_.mutex);
        for (const auto& child : children) {
            if (ctx_.processing.contains(child)) continue;
            if (const auto* entry = ctx_.store.find(child); entry && entry->isFreshCount(now, ttl)) continue;

            switch (ctx_.queue.pushBack(child)) {
                case WorkQueue::Push::Added: ++added; break;
                case WorkQueue::Push::Dropped: ++dropped; ctx_.stats.record_dropped_enqueue(); break;
                default: break;
            }
        }
    }

    if (dropped)
        log::Registry::cache()->debug("[DirectoryAggregator] Queue full, dropped {} files from {}", dropped, path);
    return added;
}

std::vector<std::string> DirectoryAggregator::eligibleChildren(const std::string& path, const bool recursive) const {
    const auto governor = ctx_.governor();
    std::vector<std::string> out;

    const auto consider = [&](const fs::directory_entry& entry) {
        std::error_code ec;
        if (!entry.is_regular_file(ec) || ec) return;
        auto key = entry.path().string();
        if (governor->checkName(key) == Verdict::Eligible) out.push_back(std::move(key));
    };

    if (!recursive) {
        for (const auto& entry : fs::directory_iterator(path)) consider(entry);
        return out;
    }

    for (auto it = fs::recursive_directory_iterator(path, fs::directory_options::skip_permission_denied);
         it != fs::recursive_directory_iterator(); ++it) {
        std::error_code ec;
        if (it->is_directory(ec)) {
            if (it->path().filename().string().starts_with('.')) it.disable_recursion_pending();
            continue;
        }
        consider(*it);
    }
    return out;
}
