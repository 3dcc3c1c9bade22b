#include "cache/TokenCache.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <stdexcept>

using namespace tt::cache;
using namespace tt::types;
using namespace tt::config;

namespace fs = std::filesystem;

TokenCache::TokenCache(CacheConfig cfg, std::shared_ptr<counting::Counter> counter, Hooks hooks)
    : ctx_(std::move(cfg), std::move(hooks)),
      batcher_(ctx_.config()->notification_batch_window),
      processor_(ctx_, std::move(counter), batcher_, ctx_.config()->worker_threads),
      scheduler_(ctx_, processor_),
      debouncer_(ctx_, scheduler_),
      directories_(ctx_, processor_, batcher_) {}

TokenCache::~TokenCache() {
    stop();
}

void TokenCache::start() {
    batcher_.start();
    debouncer_.start();
    scheduler_.start();
    log::Registry::tokentally()->info("[TokenCache] Background services started");
}

void TokenCache::stop() {
    if (!scheduler_.isRunning() && !debouncer_.isRunning() && !batcher_.isRunning()) return;
    scheduler_.stop();
    debouncer_.stop();
    batcher_.stop();
    batcher_.flush();
    log::Registry::tokentally()->info("[TokenCache] Background services stopped");
}

std::string TokenCache::normalizeKey(const std::string& path) {
    if (path.empty()) return {};
    std::error_code ec;
    auto p = fs::absolute(path, ec);
    if (ec) p = fs::path(path);
    p = p.lexically_normal();
    if (p.has_relative_path() && p.filename().empty()) p = p.parent_path();
    return p.string();
}

std::optional<CacheEntry> TokenCache::get(const std::string& path, std::optional<EntryKind> kind) {
    const auto key = normalizeKey(path);
    if (key.empty()) return std::nullopt;

    const auto cfg = ctx_.config();
    const auto now = Clock::now();

    std::optional<CacheEntry> cached; {
        std::scoped_lock lock(ctx_.mutex);
        cached = ctx_.store.get(key);
    }

    if (!kind) {
        std::error_code ec;
        kind = cached ? cached->kind : fs::is_directory(key, ec) ? EntryKind::Directory : EntryKind::File;
    }

    const bool isDirectory = *kind == EntryKind::Directory;
    const auto ttl = isDirectory ? cfg->ttl_directory : cfg->ttl_file;
    if (cached && cached->kind == *kind && !cached->isExpired(now, ttl)) return cached;

    // Caching off for this kind: serve whatever is stored, expired or not.
    if (isDirectory ? !cfg->enable_directory_caching : !cfg->enable_file_caching) return cached;

    if (isDirectory) {
        (void)directories_.computeDirectory(key);
        return CacheEntry::placeholder(key, *kind, cfg->placeholder_text, now);
    }

    if (ctx_.governor()->checkName(key) != Governor::Verdict::Eligible) return std::nullopt;

    // Only a newly queued key arms the debounce; later misses keep the deadline.
    bool newlyQueued = false; {
        std::scoped_lock lock(ctx_.mutex);
        if (!ctx_.processing.contains(key) && !ctx_.queue.contains(key))
            newlyQueued = ctx_.queue.pushFront(key) == WorkQueue::Push::Added;
    }
    if (newlyQueued) debouncer_.requestImmediate(key, now);

    return CacheEntry::placeholder(key, *kind, cfg->placeholder_text, now);
}

std::optional<CacheEntry> TokenCache::peek(const std::string& path) const {
    const auto key = normalizeKey(path);
    std::scoped_lock lock(ctx_.mutex);
    if (const auto* entry = ctx_.store.find(key)) return *entry;
    return std::nullopt;
}

std::future<ProcessResult> TokenCache::processImmediate(const std::string& path) {
    return processor_.process(normalizeKey(path));
}

std::future<DirectoryResult> TokenCache::computeDirectory(const std::string& path, const bool recursive) {
    return directories_.computeDirectory(normalizeKey(path), recursive);
}

std::size_t TokenCache::queueDirectory(const std::string& path, const bool recursive) {
    return directories_.queueDirectory(normalizeKey(path), recursive);
}

void TokenCache::invalidate(const std::string& path, const bool reprocess) {
    if (path.empty()) throw std::invalid_argument("invalidate requires a non-empty path");
    const auto key = normalizeKey(path);

    debouncer_.cancel(key);
    bool wasDirectory = false; {
        std::scoped_lock lock(ctx_.mutex);
        if (const auto* entry = ctx_.store.find(key)) wasDirectory = entry->kind == EntryKind::Directory;
        ctx_.store.erase(key);
        ctx_.queue.remove(key);
    }
    ctx_.stats.record_invalidation();
    log::Registry::cache()->debug("[TokenCache] Invalidated {}", key);

    if (!reprocess) return;

    std::error_code ec;
    if (wasDirectory || fs::is_directory(key, ec)) {
        (void)directories_.computeDirectory(key);
        return;
    }

    if (ctx_.governor()->checkName(key) != Governor::Verdict::Eligible) return;

    {
        std::scoped_lock lock(ctx_.mutex);
        ctx_.queue.pushFront(key);
    }
    scheduler_.requestDrain();
}

void TokenCache::clearAll() {
    debouncer_.clear();
    std::size_t cleared; {
        std::scoped_lock lock(ctx_.mutex);
        cleared = ctx_.store.size();
        ctx_.store.clear();
        ctx_.queue.clear();
    }
    log::Registry::cache()->info("[TokenCache] Cleared {} entries", cleared);
}

Stats TokenCache::stats() const {
    Stats s; {
        std::scoped_lock lock(ctx_.mutex);
        s.cached_count = ctx_.store.size();
        s.cached_files = ctx_.store.count(EntryKind::File);
        s.cached_directories = ctx_.store.count(EntryKind::Directory);
        s.processing_count = ctx_.processing.size();
        s.queued_count = ctx_.queue.size();
    }
    s.pending_debounces = debouncer_.pendingCount();
    s.pending_notifications = batcher_.pendingCount();
    s.scheduler_active = scheduler_.isRunning();
    s.current_interval = scheduler_.currentInterval();
    s.counters = ctx_.stats.snapshot();
    return s;
}

void TokenCache::updateConfig(CacheConfig cfg) {
    const auto previous = ctx_.config();
    ctx_.replaceConfig(std::move(cfg));
    const auto current = ctx_.config();

    batcher_.setWindow(current->notification_batch_window);

    if (current->tick_interval != previous->tick_interval ||
        current->adaptive_scheduling != previous->adaptive_scheduling) {
        scheduler_.resetInterval();
        if (scheduler_.isRunning()) scheduler_.restart();
    }

    if (current->worker_threads != previous->worker_threads)
        log::Registry::tokentally()->warn("[TokenCache] worker_threads changes take effect on the next cache instance");

    log::Registry::tokentally()->info("[TokenCache] Configuration updated (tick interval: {}ms)",
                                      current->tick_interval.count());
}

Store::SweepResult TokenCache::sweep() {
    return ctx_.sweep(Clock::now());
}

tt::notify::NotificationBatcher::SubscriptionId TokenCache::subscribe(notify::NotificationBatcher::Callback callback) {
    return batcher_.subscribe(std::move(callback));
}

bool TokenCache::unsubscribe(const notify::NotificationBatcher::SubscriptionId id) {
    return batcher_.unsubscribe(id);
}
