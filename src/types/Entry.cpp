#include "types/Entry.hpp"
#include "util/displayCount.hpp"

#include <nlohmann/json.hpp>

using namespace tt::types;

std::string tt::types::to_string(const EntryKind kind) {
    switch (kind) {
        case EntryKind::File: return "file";
        case EntryKind::Directory: return "directory";
    }
    return "unknown";
}

std::string tt::types::to_string(const EntryStatus status) {
    switch (status) {
        case EntryStatus::Ready: return "ready";
        case EntryStatus::Estimated: return "estimated";
        case EntryStatus::Oversized: return "oversized";
        case EntryStatus::Processing: return "processing";
    }
    return "unknown";
}

std::string tt::types::formatDisplay(const std::optional<uint64_t> value, const EntryStatus status) {
    if (!value) return status == EntryStatus::Oversized ? std::string(util::LARGE_TEXT) : std::string{};

    auto text = util::formatCount(*value);
    if (status == EntryStatus::Estimated) text += util::ESTIMATE_MARKER;
    else if (status == EntryStatus::Oversized) text += util::OVERSIZED_MARKER;
    return text;
}

CacheEntry CacheEntry::make(std::string key, const EntryKind kind, const EntryStatus status,
                            std::optional<uint64_t> value, const Clock::time_point computedAt) {
    CacheEntry e;
    e.key = std::move(key);
    e.kind = kind;
    e.status = status;
    e.value = value;
    e.displayText = formatDisplay(value, status);
    e.computedAt = computedAt;
    return e;
}

CacheEntry CacheEntry::placeholder(std::string key, const EntryKind kind, const std::string& placeholderText,
                                   const Clock::time_point now) {
    CacheEntry e;
    e.key = std::move(key);
    e.kind = kind;
    e.status = EntryStatus::Processing;
    e.displayText = placeholderText;
    e.computedAt = now;
    return e;
}

bool CacheEntry::isFreshCount(const Clock::time_point now, const std::chrono::milliseconds ttl) const {
    if (!value || status == EntryStatus::Processing) return false;
    return !isExpired(now, ttl);
}

void tt::types::to_json(nlohmann::json& j, const CacheEntry& e) {
    j = nlohmann::json{
        {"key", e.key},
        {"kind", to_string(e.kind)},
        {"status", to_string(e.status)},
        {"display", e.displayText},
    };
    if (e.value) j["value"] = *e.value;
    else j["value"] = nullptr;
}
