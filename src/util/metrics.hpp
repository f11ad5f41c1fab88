/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Metrics - Thread-safe statistics collection for monitoring
 *
 * Provides:
 * - Cache hit/miss/eviction counters
 * - Quota denial and compute failure counters
 * - Prune cycle statistics (deleted items, bytes freed, errors)
 * - Thread-safe collection using atomics
 */

#ifndef TOLLGATE_UTIL_METRICS_HPP
#define TOLLGATE_UTIL_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace tollgate::util {

/**
 * Metrics snapshot
 */
struct MetricsSnapshot {
    // Cache metrics
    std::uint64_t cache_hits{0};
    std::uint64_t cache_misses{0};
    std::uint64_t cache_evictions{0};
    std::uint64_t cache_expirations{0};
    double cache_hit_rate{0.0};

    // Facade metrics
    std::uint64_t computes{0};
    std::uint64_t compute_failures{0};
    std::uint64_t single_flight_joins{0};
    std::uint64_t quota_denials{0};

    // Retention metrics
    std::uint64_t prune_cycles{0};
    std::uint64_t prune_ticks_skipped{0};
    std::uint64_t jobs_pruned{0};
    std::uint64_t artifacts_pruned{0};
    std::uint64_t bytes_freed{0};
    std::uint64_t prune_errors{0};

    std::uint64_t uptime_seconds{0};

    /**
     * Serialize to JSON string
     */
    std::string to_json() const;
};

/**
 * Metrics collector
 *
 * Constructed once by the owner of the governance layer and shared by
 * std::shared_ptr with the cache facade and retention scheduler, so tests
 * can run several isolated instances side by side.
 */
class Metrics {
public:
    Metrics();

    // Non-copyable
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    // Cache tracking
    void cache_hit();
    void cache_miss();
    void cache_eviction();
    void cache_expiration();

    // Facade tracking
    void compute_started();
    void compute_failed();
    void single_flight_joined();
    void quota_denied();

    // Retention tracking
    void prune_cycle_completed(std::uint64_t jobs_deleted, std::uint64_t artifacts_deleted,
                               std::uint64_t bytes_freed, std::uint64_t errors);
    void prune_tick_skipped();

    /**
     * Get a snapshot of current metrics
     */
    MetricsSnapshot snapshot() const;

    std::uint64_t uptime_seconds() const;

private:
    std::atomic<std::uint64_t> cache_hits_{0};
    std::atomic<std::uint64_t> cache_misses_{0};
    std::atomic<std::uint64_t> cache_evictions_{0};
    std::atomic<std::uint64_t> cache_expirations_{0};

    std::atomic<std::uint64_t> computes_{0};
    std::atomic<std::uint64_t> compute_failures_{0};
    std::atomic<std::uint64_t> single_flight_joins_{0};
    std::atomic<std::uint64_t> quota_denials_{0};

    std::atomic<std::uint64_t> prune_cycles_{0};
    std::atomic<std::uint64_t> prune_ticks_skipped_{0};
    std::atomic<std::uint64_t> jobs_pruned_{0};
    std::atomic<std::uint64_t> artifacts_pruned_{0};
    std::atomic<std::uint64_t> bytes_freed_{0};
    std::atomic<std::uint64_t> prune_errors_{0};

    // Start time for uptime calculation
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace tollgate::util

#endif // TOLLGATE_UTIL_METRICS_HPP
