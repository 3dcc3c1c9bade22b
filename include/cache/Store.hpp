#pragma once

#include "types/Entry.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tt::types { struct CacheStats; }

namespace tt::cache {

/**
 * @brief Key -> entry map, the single source of truth for counts.
 *
 * Not synchronized; every call happens under Context::mutex. Reads never
 * perform I/O and never mutate the map.
 */
class Store {
public:
    struct SweepResult {
        std::size_t expired = 0;
        std::size_t evicted = 0;
    };

    explicit Store(types::CacheStats* stats = nullptr);

    [[nodiscard]] std::optional<types::CacheEntry> get(const std::string& key) const;

    // Like get() but without touching the hit/miss counters.
    [[nodiscard]] const types::CacheEntry* find(const std::string& key) const;

    // Replaces any previous entry for entry.key as a whole.
    void put(types::CacheEntry entry);

    bool erase(const std::string& key);

    /**
     * Drops entries older than the TTL of their kind, then evicts the oldest
     * remaining entries by computedAt until at most maxEntries are left.
     */
    SweepResult sweep(types::Clock::time_point now,
                      std::chrono::milliseconds ttlFile,
                      std::chrono::milliseconds ttlDirectory,
                      std::size_t maxEntries);

    void clear();

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] std::size_t count(types::EntryKind kind) const;
    [[nodiscard]] bool contains(const std::string& key) const { return entries_.contains(key); }

    [[nodiscard]] std::vector<types::CacheEntry> snapshot() const;

private:
    std::unordered_map<std::string, types::CacheEntry> entries_;
    types::CacheStats* stats_;
};

}
