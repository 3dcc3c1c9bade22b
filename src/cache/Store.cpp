#include "cache/Store.hpp"
#include "types/stats/CacheStats.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>

using namespace tt::cache;
using namespace tt::types;

Store::Store(CacheStats* stats) : stats_(stats) {}

std::optional<CacheEntry> Store::get(const std::string& key) const {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        if (stats_) stats_->record_miss();
        return std::nullopt;
    }
    if (stats_) stats_->record_hit();
    return it->second;
}

const CacheEntry* Store::find(const std::string& key) const {
    const auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

void Store::put(CacheEntry entry) {
    if (entry.key.empty()) throw std::invalid_argument("Store::put requires a non-empty key");
    auto key = entry.key;
    entries_.insert_or_assign(std::move(key), std::move(entry));
    if (stats_) stats_->record_insert();
}

bool Store::erase(const std::string& key) {
    return entries_.erase(key) > 0;
}

Store::SweepResult Store::sweep(const Clock::time_point now,
                                const std::chrono::milliseconds ttlFile,
                                const std::chrono::milliseconds ttlDirectory,
                                const std::size_t maxEntries) {
    SweepResult result;

    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto ttl = it->second.kind == EntryKind::Directory ? ttlDirectory : ttlFile;
        if (it->second.isExpired(now, ttl)) {
            it = entries_.erase(it);
            ++result.expired;
        } else ++it;
    }

    if (entries_.size() > maxEntries) {
        std::vector<std::pair<Clock::time_point, std::string>> byAge;
        byAge.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) byAge.emplace_back(entry.computedAt, key);

        const auto excess = entries_.size() - maxEntries;
        std::ranges::nth_element(byAge, byAge.begin() + static_cast<std::ptrdiff_t>(excess));
        for (const auto& key : byAge | std::views::take(static_cast<std::ptrdiff_t>(excess)) | std::views::values)
            entries_.erase(key);
        result.evicted = excess;
    }

    if (stats_) {
        if (result.expired) stats_->record_expiration(result.expired);
        if (result.evicted) stats_->record_eviction(result.evicted);
    }

    return result;
}

void Store::clear() {
    entries_.clear();
}

std::size_t Store::count(const EntryKind kind) const {
    return static_cast<std::size_t>(std::ranges::count_if(entries_, [kind](const auto& kv) {
        return kv.second.kind == kind;
    }));
}

std::vector<CacheEntry> Store::snapshot() const {
    std::vector<CacheEntry> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_ | std::views::values) out.push_back(entry);
    return out;
}
