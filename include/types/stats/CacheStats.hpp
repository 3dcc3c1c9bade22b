#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include <nlohmann/json_fwd.hpp>

namespace tt::types {

// 64-byte cache line padding helper to avoid false sharing.
constexpr std::size_t kCacheLine = 64;

template <typename T>
struct alignas(kCacheLine) PaddedAtomic {
    std::atomic<T> v{0};
    char pad[kCacheLine - (sizeof(std::atomic<T>) % kCacheLine ? (sizeof(std::atomic<T>) % kCacheLine) : kCacheLine)]{};
};

struct LatencyStats {
    PaddedAtomic<uint64_t> count;
    PaddedAtomic<uint64_t> total_us;
    PaddedAtomic<uint64_t> max_us;

    void observe_us(uint64_t us) noexcept;
};

struct CacheStatsSnapshot {
    uint64_t hits{};
    uint64_t misses{};

    uint64_t inserts{};
    uint64_t evictions{};
    uint64_t expirations{};
    uint64_t invalidations{};

    uint64_t processed{};
    uint64_t estimated{};
    uint64_t oversized{};
    uint64_t read_failures{};

    uint64_t dropped_enqueues{};
    uint64_t ticks{};
    uint64_t busy_ticks_skipped{};

    uint64_t op_count{};
    uint64_t op_total_us{};
    uint64_t op_max_us{};
};

/**
 * Lock-free counters shared by the store, processor and scheduler.
 * Writers bump them from any thread; readers take a snapshot().
 */
struct CacheStats {
    PaddedAtomic<uint64_t> hits;
    PaddedAtomic<uint64_t> misses;

    PaddedAtomic<uint64_t> inserts;
    PaddedAtomic<uint64_t> evictions;
    PaddedAtomic<uint64_t> expirations;
    PaddedAtomic<uint64_t> invalidations;

    PaddedAtomic<uint64_t> processed;
    PaddedAtomic<uint64_t> estimated;
    PaddedAtomic<uint64_t> oversized;
    PaddedAtomic<uint64_t> read_failures;

    PaddedAtomic<uint64_t> dropped_enqueues;
    PaddedAtomic<uint64_t> ticks;
    PaddedAtomic<uint64_t> busy_ticks_skipped;

    LatencyStats op_latency;

    void record_hit() noexcept;
    void record_miss() noexcept;
    void record_insert() noexcept;
    void record_eviction(uint64_t n = 1) noexcept;
    void record_expiration(uint64_t n = 1) noexcept;
    void record_invalidation() noexcept;
    void record_processed() noexcept;
    void record_estimated() noexcept;
    void record_oversized() noexcept;
    void record_read_failure() noexcept;
    void record_dropped_enqueue() noexcept;
    void record_tick() noexcept;
    void record_busy_skip() noexcept;

    void record_op_us(uint64_t us) noexcept;

    [[nodiscard]] CacheStatsSnapshot snapshot() const noexcept;

    static double hit_rate(const CacheStatsSnapshot& s) noexcept;
    static double avg_op_ms(const CacheStatsSnapshot& s) noexcept;
};

// Point-in-time view returned by TokenCache::stats().
struct Stats {
    uint64_t cached_count{};
    uint64_t cached_files{};
    uint64_t cached_directories{};
    uint64_t processing_count{};
    uint64_t queued_count{};
    uint64_t pending_debounces{};
    uint64_t pending_notifications{};
    bool scheduler_active{false};
    std::chrono::milliseconds current_interval{0};
    CacheStatsSnapshot counters;
};

void to_json(nlohmann::json& j, const CacheStatsSnapshot& s);
void to_json(nlohmann::json& j, const Stats& s);

} // namespace tt::types
