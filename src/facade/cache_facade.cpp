/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Cache Facade - Implementation
 */

#include "facade/cache_facade.hpp"

#include "util/logger.hpp"

#include <stdexcept>
#include <utility>

namespace tollgate::facade {

using util::log_component::Facade;
using quota::Resource;

std::string_view to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::hit:            return "hit";
        case FetchStatus::computed:       return "computed";
        case FetchStatus::uncached:       return "uncached";
        case FetchStatus::quota_exceeded: return "quota_exceeded";
        case FetchStatus::compute_failed: return "compute_failed";
        default:                          return "unknown";
    }
}

CacheFacade::CacheFacade(std::shared_ptr<cache::CacheStore> store,
                         std::shared_ptr<quota::QuotaLedger> ledger,
                         std::shared_ptr<util::Metrics> metrics)
    : store_(std::move(store))
    , ledger_(std::move(ledger))
    , metrics_(std::move(metrics))
{
    if (!store_ || !ledger_ || !metrics_) {
        throw std::invalid_argument("CacheFacade requires store, ledger and metrics");
    }

    // Entries leave the store for many reasons; each one gives its bytes back to the owner
    store_->on_removal([ledger = ledger_, metrics = metrics_](const cache::CacheEntry& entry,
                                                             cache::RemovalReason reason) {
        ledger->release(entry.owner, Resource::cache_bytes, entry.size_bytes);

        if (reason == cache::RemovalReason::evicted) {
            metrics->cache_eviction();
            util::Logger::instance().event(util::EventLogEntry{
                .kind = util::EventKind::cache_eviction,
                .tenant_id = entry.owner,
                .subject = entry.key,
                .amount = static_cast<std::int64_t>(entry.size_bytes),
                .detail = "lru"
            });
        } else if (reason == cache::RemovalReason::expired) {
            metrics->cache_expiration();
        }
    });
}

FetchResult CacheFacade::get_or_compute(const std::string& key, cache::Ttl ttl,
                                        const std::string& tenant_id, const ComputeFn& compute,
                                        std::size_t estimated_size) {
    if (auto value = store_->get(key)) {
        return hit(key, tenant_id, std::move(*value));
    }

    // Each call counts as exactly one hit or one miss
    bool counted = false;

    for (;;) {
        std::promise<FetchResult> promise;
        std::shared_future<FetchResult> flight;
        std::string flight_tenant;
        bool leader = false;
        {
            std::lock_guard<std::mutex> lock(flights_mutex_);
            auto it = flights_.find(key);
            if (it != flights_.end()) {
                flight = it->second.result;
                flight_tenant = it->second.tenant_id;
            } else {
                flight = promise.get_future().share();
                flights_.emplace(key, Flight{tenant_id, flight});
                leader = true;
            }
        }

        if (!leader) {
            if (!std::exchange(counted, true)) {
                miss(key, tenant_id);
            }
            metrics_->single_flight_joined();
            TOLLGATE_LOG_DEBUG(Facade, "Joined in-flight compute: key={}, tenant={}", key, tenant_id);

            auto result = flight.get();
            // The denial belongs to the leader's tenant; this one may still have room
            if (result.status == FetchStatus::quota_exceeded && flight_tenant != tenant_id) {
                TOLLGATE_LOG_DEBUG(Facade, "Flight denied for tenant={}, retrying for tenant={}: key={}",
                                   flight_tenant, tenant_id, key);
                continue;
            }
            return result;
        }

        // A previous flight may have finished between our miss and registering this one
        if (auto value = store_->get(key)) {
            FetchResult result;
            if (counted) {
                result = FetchResult{.status = FetchStatus::hit, .value = std::move(value)};
            } else {
                result = hit(key, tenant_id, std::move(*value));
            }
            finish(key, promise, result);
            return result;
        }
        if (!std::exchange(counted, true)) {
            miss(key, tenant_id);
        }

        FetchResult result;
        try {
            result = compute_and_store(key, ttl, tenant_id, compute, estimated_size);
        } catch (...) {
            // Waiters must not hang on a broken promise
            finish(key, promise, FetchResult{.status = FetchStatus::compute_failed,
                                             .error = "internal error while caching result"});
            throw;
        }

        finish(key, promise, result);
        return result;
    }
}

FetchResult CacheFacade::get_or_compute(const std::string& key, const std::string& tenant_id,
                                        const ComputeFn& compute, std::size_t estimated_size) {
    return get_or_compute(key, store_->config().default_ttl, tenant_id, compute, estimated_size);
}

FetchResult CacheFacade::compute_and_store(const std::string& key, cache::Ttl ttl,
                                           const std::string& tenant_id, const ComputeFn& compute,
                                           std::size_t estimated_size) {
    auto decision = ledger_->reserve(tenant_id, Resource::cache_bytes, estimated_size);
    if (!decision) {
        return deny(key, tenant_id, std::move(decision));
    }

    metrics_->compute_started();

    ComputeResult computed;
    try {
        computed = compute(key);
    } catch (const std::exception& e) {
        return fail(key, tenant_id, estimated_size, std::move(decision), e.what());
    } catch (...) {
        return fail(key, tenant_id, estimated_size, std::move(decision), "unknown error");
    }

    auto actual = computed.size_bytes.value_or(computed.value.size());

    if (actual > estimated_size) {
        auto extra = ledger_->reserve(tenant_id, Resource::cache_bytes, actual - estimated_size);
        if (!extra) {
            ledger_->release(tenant_id, Resource::cache_bytes, estimated_size);
            return deny(key, tenant_id, std::move(extra));
        }
    } else if (actual < estimated_size) {
        ledger_->release(tenant_id, Resource::cache_bytes, estimated_size - actual);
    }

    auto status = store_->put(key, computed.value, ttl, tenant_id, actual);
    if (status == cache::PutStatus::entry_too_large || status == cache::PutStatus::no_room) {
        ledger_->release(tenant_id, Resource::cache_bytes, actual);
        TOLLGATE_LOG_DEBUG(Facade, "Result not cached ({}): key={}, size={}",
                           cache::to_string(status), key, actual);
        return FetchResult{.status = FetchStatus::uncached, .value = std::move(computed.value),
                           .decision = decision};
    }

    TOLLGATE_LOG_DEBUG(Facade, "Computed and cached: key={}, tenant={}, size={}", key, tenant_id, actual);
    return FetchResult{.status = FetchStatus::computed, .value = std::move(computed.value),
                       .decision = decision};
}

FetchResult CacheFacade::deny(const std::string& key, const std::string& tenant_id,
                              quota::QuotaDecision decision) {
    metrics_->quota_denied();
    util::Logger::instance().event(util::EventLogEntry{
        .kind = util::EventKind::quota_denial,
        .tenant_id = tenant_id,
        .subject = std::string(quota::to_string(decision.resource)),
        .amount = static_cast<std::int64_t>(decision.current),
        .detail = decision.reason
    });
    TOLLGATE_LOG_INFO(Facade, "Quota denied: key={}, tenant={}: {}", key, tenant_id, decision.reason);

    auto reason = decision.reason;
    return FetchResult{.status = FetchStatus::quota_exceeded, .decision = std::move(decision),
                       .error = std::move(reason)};
}

FetchResult CacheFacade::fail(const std::string& key, const std::string& tenant_id, std::size_t reserved,
                              quota::QuotaDecision decision, std::string message) {
    ledger_->release(tenant_id, Resource::cache_bytes, reserved);
    metrics_->compute_failed();
    util::Logger::instance().event(util::EventLogEntry{
        .kind = util::EventKind::compute_failure,
        .tenant_id = tenant_id,
        .subject = key,
        .amount = 0,
        .detail = message
    });
    TOLLGATE_LOG_WARN(Facade, "Compute failed: key={}, tenant={}: {}", key, tenant_id, message);
    return FetchResult{.status = FetchStatus::compute_failed, .decision = std::move(decision),
                       .error = std::move(message)};
}

FetchResult CacheFacade::hit(const std::string& key, const std::string& tenant_id, std::string value) {
    metrics_->cache_hit();
    util::Logger::instance().event(util::EventLogEntry{
        .kind = util::EventKind::cache_hit,
        .tenant_id = tenant_id,
        .subject = key,
        .amount = static_cast<std::int64_t>(value.size()),
        .detail = {}
    });
    return FetchResult{.status = FetchStatus::hit, .value = std::move(value)};
}

void CacheFacade::miss(const std::string& key, const std::string& tenant_id) {
    metrics_->cache_miss();
    util::Logger::instance().event(util::EventLogEntry{
        .kind = util::EventKind::cache_miss,
        .tenant_id = tenant_id,
        .subject = key,
        .amount = 0,
        .detail = {}
    });
}

void CacheFacade::finish(const std::string& key, std::promise<FetchResult>& promise,
                         const FetchResult& result) {
    {
        std::lock_guard<std::mutex> lock(flights_mutex_);
        flights_.erase(key);
    }
    promise.set_value(result);
}

bool CacheFacade::invalidate(const std::string& key) {
    return store_->invalidate(key);
}

std::size_t CacheFacade::invalidate_prefix(std::string_view prefix) {
    return store_->invalidate_prefix(prefix);
}

std::size_t CacheFacade::in_flight() const {
    std::lock_guard<std::mutex> lock(flights_mutex_);
    return flights_.size();
}

} // namespace tollgate::facade
