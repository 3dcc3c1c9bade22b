#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tt::cache {

/**
 * @brief Eligibility and capacity policy. Immutable once built; a config
 * update replaces the whole governor.
 */
class Governor {
public:
    enum class Verdict {
        Eligible,
        EmptyPath,
        SkippedName,        // hidden, *.lock, *.tmp
        NoExtension,
        InvalidExtension,
        Ignored,            // matched an ignore glob
        NotFile,
        Oversized
    };

    using BusyPredicate = std::function<bool()>;

    explicit Governor(const config::CacheConfig& cfg, BusyPredicate hostBusy = {});

    // Name-only checks; no filesystem access.
    [[nodiscard]] Verdict checkName(const std::string& path) const;

    // checkName() plus stat(); skipSizeCheck lifts the size ceiling.
    [[nodiscard]] Verdict check(const std::string& path, bool skipSizeCheck = false) const;

    [[nodiscard]] std::size_t spareCapacity(std::size_t inFlight) const;
    [[nodiscard]] bool hasCapacity(std::size_t inFlight) const { return spareCapacity(inFlight) > 0; }

    // A throwing predicate counts as "not busy".
    [[nodiscard]] bool hostBusy() const;

private:
    std::unordered_set<std::string> extensions_;
    std::vector<std::string> ignorePatterns_;
    uintmax_t maxFileSizeBytes_;
    std::size_t maxConcurrentJobs_;
    BusyPredicate hostBusy_;
};

std::string to_string(Governor::Verdict verdict);

}
