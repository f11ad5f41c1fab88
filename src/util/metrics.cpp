/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Metrics Implementation
 */

#include "util/metrics.hpp"

#include <nlohmann/json.hpp>

namespace tollgate::util {

Metrics::Metrics()
    : start_time_(std::chrono::steady_clock::now())
{
}

void Metrics::cache_hit() {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_miss() {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_eviction() {
    cache_evictions_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::cache_expiration() {
    cache_expirations_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::compute_started() {
    computes_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::compute_failed() {
    compute_failures_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::single_flight_joined() {
    single_flight_joins_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::quota_denied() {
    quota_denials_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::prune_cycle_completed(std::uint64_t jobs_deleted, std::uint64_t artifacts_deleted,
                                    std::uint64_t bytes_freed, std::uint64_t errors) {
    prune_cycles_.fetch_add(1, std::memory_order_relaxed);
    jobs_pruned_.fetch_add(jobs_deleted, std::memory_order_relaxed);
    artifacts_pruned_.fetch_add(artifacts_deleted, std::memory_order_relaxed);
    bytes_freed_.fetch_add(bytes_freed, std::memory_order_relaxed);
    prune_errors_.fetch_add(errors, std::memory_order_relaxed);
}

void Metrics::prune_tick_skipped() {
    prune_ticks_skipped_.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t Metrics::uptime_seconds() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
}

MetricsSnapshot Metrics::snapshot() const {
    MetricsSnapshot snap;

    snap.cache_hits = cache_hits_.load(std::memory_order_relaxed);
    snap.cache_misses = cache_misses_.load(std::memory_order_relaxed);
    snap.cache_evictions = cache_evictions_.load(std::memory_order_relaxed);
    snap.cache_expirations = cache_expirations_.load(std::memory_order_relaxed);
    auto cache_total = snap.cache_hits + snap.cache_misses;
    snap.cache_hit_rate = cache_total > 0
        ? static_cast<double>(snap.cache_hits) / cache_total
        : 0.0;

    snap.computes = computes_.load(std::memory_order_relaxed);
    snap.compute_failures = compute_failures_.load(std::memory_order_relaxed);
    snap.single_flight_joins = single_flight_joins_.load(std::memory_order_relaxed);
    snap.quota_denials = quota_denials_.load(std::memory_order_relaxed);

    snap.prune_cycles = prune_cycles_.load(std::memory_order_relaxed);
    snap.prune_ticks_skipped = prune_ticks_skipped_.load(std::memory_order_relaxed);
    snap.jobs_pruned = jobs_pruned_.load(std::memory_order_relaxed);
    snap.artifacts_pruned = artifacts_pruned_.load(std::memory_order_relaxed);
    snap.bytes_freed = bytes_freed_.load(std::memory_order_relaxed);
    snap.prune_errors = prune_errors_.load(std::memory_order_relaxed);

    snap.uptime_seconds = uptime_seconds();

    return snap;
}

std::string MetricsSnapshot::to_json() const {
    nlohmann::json j = {
        {"uptime_seconds", uptime_seconds},
        {"cache", {
            {"hits", cache_hits},
            {"misses", cache_misses},
            {"evictions", cache_evictions},
            {"expirations", cache_expirations},
            {"hit_rate", cache_hit_rate}
        }},
        {"facade", {
            {"computes", computes},
            {"compute_failures", compute_failures},
            {"single_flight_joins", single_flight_joins},
            {"quota_denials", quota_denials}
        }},
        {"retention", {
            {"cycles", prune_cycles},
            {"ticks_skipped", prune_ticks_skipped},
            {"jobs_pruned", jobs_pruned},
            {"artifacts_pruned", artifacts_pruned},
            {"bytes_freed", bytes_freed},
            {"errors", prune_errors}
        }}
    };
    return j.dump(2);
}

} // namespace tollgate::util
