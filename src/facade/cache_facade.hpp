/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Cache Facade - Read-through result cache with quota accounting
 *
 * get_or_compute() is the public entry point:
 * 1. Fresh cache hit: returned without touching the ledger
 * 2. Miss: reserve the estimated size as cache_bytes for the tenant
 * 3. Run the compute callback (the only step that may block for long)
 * 4. Reconcile the reservation with the actual size, then cache the value
 *
 * Concurrent callers for the same missing key share one compute. A joiner from
 * another tenant that receives the leader's quota denial retries under its own quota.
 */

#ifndef TOLLGATE_FACADE_CACHE_FACADE_HPP
#define TOLLGATE_FACADE_CACHE_FACADE_HPP

#include "cache/cache_store.hpp"
#include "quota/quota_ledger.hpp"
#include "util/metrics.hpp"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tollgate::facade {

/**
 * Value produced by the query engine
 */
struct ComputeResult {
    std::string value;
    std::optional<std::size_t> size_bytes;   // Defaults to value.size()
};

/**
 * Query engine callback; failure is signalled by throwing
 */
using ComputeFn = std::function<ComputeResult(const std::string& key)>;

/**
 * Outcome of get_or_compute()
 */
enum class FetchStatus {
    hit,             // Served from cache
    computed,        // Computed and cached
    uncached,        // Computed but not cacheable (too large / no room), value still returned
    quota_exceeded,  // Tenant over its cache_bytes quota, nothing computed or cached
    compute_failed   // Compute threw, nothing cached
};

std::string_view to_string(FetchStatus status);

struct FetchResult {
    FetchStatus status{FetchStatus::hit};
    std::optional<std::string> value;
    quota::QuotaDecision decision;   // Set for quota_exceeded
    std::string error;               // Denial reason or compute failure message

    bool ok() const noexcept {
        return status == FetchStatus::hit || status == FetchStatus::computed ||
               status == FetchStatus::uncached;
    }
};

/**
 * Cache facade
 *
 * Every entry it stores is owned by the requesting tenant. Whenever an entry
 * leaves the store, for whatever reason, the owner's cache_bytes are released.
 */
class CacheFacade {
public:
    CacheFacade(std::shared_ptr<cache::CacheStore> store,
                std::shared_ptr<quota::QuotaLedger> ledger,
                std::shared_ptr<util::Metrics> metrics);

    // Non-copyable
    CacheFacade(const CacheFacade&) = delete;
    CacheFacade& operator=(const CacheFacade&) = delete;

    /**
     * Return the cached value for key or compute, account and cache it
     *
     * @param key Cache key
     * @param ttl Time-to-live for a newly cached value
     * @param tenant_id Tenant charged for the cached bytes
     * @param compute Query engine callback
     * @param estimated_size Bytes reserved before computing
     */
    FetchResult get_or_compute(const std::string& key, cache::Ttl ttl, const std::string& tenant_id,
                               const ComputeFn& compute, std::size_t estimated_size = 0);

    /**
     * As above, with the store's default TTL
     */
    FetchResult get_or_compute(const std::string& key, const std::string& tenant_id,
                               const ComputeFn& compute, std::size_t estimated_size = 0);

    bool invalidate(const std::string& key);
    std::size_t invalidate_prefix(std::string_view prefix);

    /**
     * Number of keys with a compute in flight
     */
    std::size_t in_flight() const;

    const std::shared_ptr<cache::CacheStore>& store() const noexcept { return store_; }
    const std::shared_ptr<quota::QuotaLedger>& ledger() const noexcept { return ledger_; }

private:
    FetchResult compute_and_store(const std::string& key, cache::Ttl ttl, const std::string& tenant_id,
                                  const ComputeFn& compute, std::size_t estimated_size);

    FetchResult deny(const std::string& key, const std::string& tenant_id, quota::QuotaDecision decision);

    /**
     * Return the reservation of a failed compute and report the failure
     */
    FetchResult fail(const std::string& key, const std::string& tenant_id, std::size_t reserved,
                     quota::QuotaDecision decision, std::string message);

    FetchResult hit(const std::string& key, const std::string& tenant_id, std::string value);
    void miss(const std::string& key, const std::string& tenant_id);

    /**
     * Publish the leader's result to waiters and forget the flight
     */
    void finish(const std::string& key, std::promise<FetchResult>& promise, const FetchResult& result);

    std::shared_ptr<cache::CacheStore> store_;
    std::shared_ptr<quota::QuotaLedger> ledger_;
    std::shared_ptr<util::Metrics> metrics_;

    /**
     * Compute in progress for one key
     */
    struct Flight {
        std::string tenant_id;   // Tenant charged by the leader
        std::shared_future<FetchResult> result;
    };

    mutable std::mutex flights_mutex_;
    std::unordered_map<std::string, Flight> flights_;
};

} // namespace tollgate::facade

#endif // TOLLGATE_FACADE_CACHE_FACADE_HPP
