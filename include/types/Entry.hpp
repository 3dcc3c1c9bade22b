#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tt::types {

using Clock = std::chrono::steady_clock;

enum class EntryKind { File, Directory };

enum class EntryStatus {
    Ready,      // value came from the counter
    Estimated,  // counter failed, value is the local heuristic
    Oversized,  // value scaled from a head sample, or LARGE_SENTINEL
    Processing  // placeholder handed out while the key is pending
};

std::string to_string(EntryKind kind);
std::string to_string(EntryStatus status);

/**
 * Cached result for one key. Built only through the factories so that
 * displayText always matches value and status.
 */
struct CacheEntry {
    std::string key;
    std::optional<uint64_t> value;
    std::string displayText;
    EntryKind kind = EntryKind::File;
    EntryStatus status = EntryStatus::Ready;
    Clock::time_point computedAt{};

    static CacheEntry make(std::string key, EntryKind kind, EntryStatus status,
                           std::optional<uint64_t> value, Clock::time_point computedAt);

    static CacheEntry placeholder(std::string key, EntryKind kind, const std::string& placeholderText,
                                  Clock::time_point now = Clock::now());

    [[nodiscard]] bool hasValue() const { return value.has_value(); }

    // Usable as a summand: carries a computed value and is younger than ttl.
    [[nodiscard]] bool isFreshCount(Clock::time_point now, std::chrono::milliseconds ttl) const;

    [[nodiscard]] bool isExpired(Clock::time_point now, std::chrono::milliseconds ttl) const {
        return now - computedAt > ttl;
    }

    bool operator==(const CacheEntry&) const = default;
};

std::string formatDisplay(std::optional<uint64_t> value, EntryStatus status);

void to_json(nlohmann::json& j, const CacheEntry& e);

}
