#include "types/stats/CacheStats.hpp"

#include <nlohmann/json.hpp>

using namespace tt::types;

namespace {

inline void bump(PaddedAtomic<uint64_t>& a, const uint64_t n = 1) noexcept {
    a.v.fetch_add(n, std::memory_order_relaxed);
}

inline uint64_t load(const PaddedAtomic<uint64_t>& a) noexcept {
    return a.v.load(std::memory_order_relaxed);
}

}

void LatencyStats::observe_us(uint64_t us) noexcept {
    count.v.fetch_add(1, std::memory_order_relaxed);
    total_us.v.fetch_add(us, std::memory_order_relaxed);

    uint64_t cur = max_us.v.load(std::memory_order_relaxed);
    while (us > cur && !max_us.v.compare_exchange_weak(cur, us, std::memory_order_relaxed)) {
        // cur updated by compare_exchange_weak
    }
}

void CacheStats::record_hit() noexcept { bump(hits); }
void CacheStats::record_miss() noexcept { bump(misses); }
void CacheStats::record_insert() noexcept { bump(inserts); }
void CacheStats::record_eviction(const uint64_t n) noexcept { bump(evictions, n); }
void CacheStats::record_expiration(const uint64_t n) noexcept { bump(expirations, n); }
void CacheStats::record_invalidation() noexcept { bump(invalidations); }
void CacheStats::record_processed() noexcept { bump(processed); }
void CacheStats::record_estimated() noexcept { bump(estimated); }
void CacheStats::record_oversized() noexcept { bump(oversized); }
void CacheStats::record_read_failure() noexcept { bump(read_failures); }
void CacheStats::record_dropped_enqueue() noexcept { bump(dropped_enqueues); }
void CacheStats::record_tick() noexcept { bump(ticks); }
void CacheStats::record_busy_skip() noexcept { bump(busy_ticks_skipped); }

void CacheStats::record_op_us(uint64_t us) noexcept {
    op_latency.observe_us(us);
}

CacheStatsSnapshot CacheStats::snapshot() const noexcept {
    CacheStatsSnapshot s;
    s.hits = load(hits);
    s.misses = load(misses);

    s.inserts = load(inserts);
    s.evictions = load(evictions);
    s.expirations = load(expirations);
    s.invalidations = load(invalidations);

    s.processed = load(processed);
    s.estimated = load(estimated);
    s.oversized = load(oversized);
    s.read_failures = load(read_failures);

    s.dropped_enqueues = load(dropped_enqueues);
    s.ticks = load(ticks);
    s.busy_ticks_skipped = load(busy_ticks_skipped);

    s.op_count = load(op_latency.count);
    s.op_total_us = load(op_latency.total_us);
    s.op_max_us = load(op_latency.max_us);

    return s;
}

double CacheStats::hit_rate(const CacheStatsSnapshot& s) noexcept {
    const auto denom = s.hits + s.misses;
    return denom ? static_cast<double>(s.hits) / static_cast<double>(denom) : 0.0;
}

double CacheStats::avg_op_ms(const CacheStatsSnapshot& s) noexcept {
    return s.op_count ? (static_cast<double>(s.op_total_us) / 1000.0) / static_cast<double>(s.op_count) : 0.0;
}

void tt::types::to_json(nlohmann::json& j, const CacheStatsSnapshot& s) {
    j = nlohmann::json{
        {"hits", s.hits},
        {"misses", s.misses},
        {"hit_rate", CacheStats::hit_rate(s)},

        {"inserts", s.inserts},
        {"evictions", s.evictions},
        {"expirations", s.expirations},
        {"invalidations", s.invalidations},

        {"processed", s.processed},
        {"estimated", s.estimated},
        {"oversized", s.oversized},
        {"read_failures", s.read_failures},

        {"dropped_enqueues", s.dropped_enqueues},
        {"ticks", s.ticks},
        {"busy_ticks_skipped", s.busy_ticks_skipped},

        {"op", {
            {"count", s.op_count},
            {"total_us", s.op_total_us},
            {"max_us", s.op_max_us},
            {"avg_ms", CacheStats::avg_op_ms(s)},
        }},
    };
}

void tt::types::to_json(nlohmann::json& j, const Stats& s) {
    j = nlohmann::json{
        {"cached_count", s.cached_count},
        {"cached_files", s.cached_files},
        {"cached_directories", s.cached_directories},
        {"processing_count", s.processing_count},
        {"queued_count", s.queued_count},
        {"pending_debounces", s.pending_debounces},
        {"pending_notifications", s.pending_notifications},
        {"scheduler_active", s.scheduler_active},
        {"current_interval_ms", s.current_interval.count()},
        {"counters", s.counters},
    };
}
