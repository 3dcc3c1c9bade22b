#pragma once

#include "cache/Context.hpp"
#include "cache/Debouncer.hpp"
#include "cache/DirectoryAggregator.hpp"
#include "cache/Processor.hpp"
#include "cache/Scheduler.hpp"
#include "counting/Counter.hpp"
#include "notify/NotificationBatcher.hpp"
#include "types/Entry.hpp"
#include "types/stats/CacheStats.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>

namespace tt::cache {

/**
 * @brief One independent token cache: store, queue, services and pools.
 *
 * Construction is inert; nothing runs in the background until start().
 * Keys are absolute, lexically normalized paths; every public call
 * normalizes the path it is given.
 */
class TokenCache {
public:
    TokenCache(config::CacheConfig cfg, std::shared_ptr<counting::Counter> counter, Hooks hooks = {});
    ~TokenCache();

    TokenCache(const TokenCache&) = delete;
    TokenCache& operator=(const TokenCache&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const { return scheduler_.isRunning(); }

    /**
     * Fresh entry if there is one. Otherwise schedules a computation
     * (debounced for files, aggregated for directories) and returns a
     * placeholder entry. A file miss is queued at the front and debounced
     * once; repeated misses do not postpone it. When caching of the kind is
     * disabled the cached entry is returned even if expired. std::nullopt
     * for ineligible files and for disabled kinds with nothing cached.
     */
    std::optional<types::CacheEntry> get(const std::string& path,
                                         std::optional<types::EntryKind> kind = std::nullopt);

    // Current entry, fresh or not, without scheduling anything.
    [[nodiscard]] std::optional<types::CacheEntry> peek(const std::string& path) const;

    // Files only; skips the debounce and the queue.
    std::future<ProcessResult> processImmediate(const std::string& path);

    std::future<DirectoryResult> computeDirectory(const std::string& path, bool recursive = false);

    std::size_t queueDirectory(const std::string& path, bool recursive = false);

    // Throws std::invalid_argument on an empty path.
    void invalidate(const std::string& path, bool reprocess = false);

    void clearAll();

    [[nodiscard]] types::Stats stats() const;

    // Throws std::invalid_argument when cfg does not validate; the old config stays.
    void updateConfig(config::CacheConfig cfg);

    [[nodiscard]] config::CacheConfig getConfig() const { return *ctx_.config(); }

    Store::SweepResult sweep();

    notify::NotificationBatcher::SubscriptionId subscribe(notify::NotificationBatcher::Callback callback);
    bool unsubscribe(notify::NotificationBatcher::SubscriptionId id);

    Context& context() { return ctx_; }
    Scheduler& scheduler() { return scheduler_; }
    Debouncer& debouncer() { return debouncer_; }
    notify::NotificationBatcher& notifications() { return batcher_; }

    static std::string normalizeKey(const std::string& path);

private:
    Context ctx_;
    notify::NotificationBatcher batcher_;
    Processor processor_;
    Scheduler scheduler_;
    Debouncer debouncer_;
    DirectoryAggregator directories_;
};

}
