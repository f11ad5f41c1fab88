/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Quota Ledger Implementation
 */

#include "quota/quota_ledger.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <set>

namespace tollgate::quota {

using util::log_component::Quota;

std::string_view to_string(Resource resource) {
    switch (resource) {
        case Resource::jobs:         return "jobs";
        case Resource::artifacts:    return "artifacts";
        case Resource::cache_bytes:  return "cache_bytes";
        case Resource::api_requests: return "api_requests";
        default:                     return "unknown";
    }
}

std::optional<Resource> parse_resource(std::string_view name) {
    if (name == "jobs") return Resource::jobs;
    if (name == "artifacts") return Resource::artifacts;
    if (name == "cache_bytes") return Resource::cache_bytes;
    if (name == "api_requests") return Resource::api_requests;
    return std::nullopt;
}

QuotaDecision QuotaLedger::check(const std::string& tenant_id, Resource resource,
                                 std::uint64_t amount) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decide_locked(tenant_id, resource, amount, Clock::now());
}

QuotaDecision QuotaLedger::reserve(const std::string& tenant_id, Resource resource,
                                   std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    auto decision = decide_locked(tenant_id, resource, amount, now);
    if (!decision.allowed) {
        TOLLGATE_LOG_DEBUG(Quota, "Reservation denied: tenant={}, resource={}, amount={}, current={}, limit={}",
                           tenant_id, to_string(resource), amount, decision.current, *decision.limit);
        return decision;
    }

    CounterKey key{tenant_id, resource};
    auto [it, inserted] = counters_.try_emplace(key);
    auto& counter = it->second;
    if (inserted) {
        counter.tenant_id = tenant_id;
        counter.resource = resource;
        counter.window_start = now;
    }

    // decide_locked() already treated an elapsed window as empty; commit that reset
    auto limit = limit_locked(tenant_id, resource);
    if (limit && limit->window && now - counter.window_start >= *limit->window) {
        counter.consumed = 0;
        counter.window_start = now;
    }

    counter.consumed += amount;
    counter.updated_at = now;

    TOLLGATE_LOG_TRACE(Quota, "Reserved {} {} for tenant {} (consumed={})",
                       amount, to_string(resource), tenant_id, counter.consumed);
    return decision;
}

void QuotaLedger::release(const std::string& tenant_id, Resource resource, std::uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = counters_.find(CounterKey{tenant_id, resource});
    if (it == counters_.end()) {
        return;
    }

    auto& counter = it->second;
    counter.consumed = amount >= counter.consumed ? 0 : counter.consumed - amount;
    counter.updated_at = Clock::now();

    TOLLGATE_LOG_TRACE(Quota, "Released {} {} for tenant {} (consumed={})",
                       amount, to_string(resource), tenant_id, counter.consumed);
}

std::map<Resource, std::uint64_t> QuotaLedger::usage(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    std::map<Resource, std::uint64_t> result;
    for (const auto& [key, counter] : counters_) {
        if (key.first == tenant_id) {
            result[key.second] = consumed_locked(key, limit_locked(key.first, key.second), now);
        }
    }
    return result;
}

std::vector<UsageSummary> QuotaLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();

    // Every tenant/resource pair that has a counter or an explicit policy
    std::set<CounterKey> keys;
    for (const auto& [key, counter] : counters_) {
        keys.insert(key);
    }
    for (const auto& [key, limit] : policies_) {
        keys.insert(key);
    }

    std::vector<UsageSummary> summaries;
    summaries.reserve(keys.size());
    for (const auto& key : keys) {
        auto limit = limit_locked(key.first, key.second);

        UsageSummary summary;
        summary.tenant_id = key.first;
        summary.tier = tier_locked(key.first);
        summary.resource = key.second;
        summary.consumed = consumed_locked(key, limit, now);
        if (limit) {
            summary.limit = limit->limit;
        }
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

void QuotaLedger::set_policy(const QuotaPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policies_[CounterKey{policy.tenant_id, policy.resource}] = QuotaLimit{policy.limit, policy.window};

    TOLLGATE_LOG_INFO(Quota, "Policy set: tenant={}, resource={}, limit={}{}",
                      policy.tenant_id, to_string(policy.resource), policy.limit,
                      policy.window ? fmt::format(", window={}s", policy.window->count()) : "");
}

bool QuotaLedger::remove_policy(const std::string& tenant_id, Resource resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    return policies_.erase(CounterKey{tenant_id, resource}) > 0;
}

void QuotaLedger::set_tiers(std::vector<TierPolicy> tiers, std::string default_tier) {
    std::lock_guard<std::mutex> lock(mutex_);

    tiers_.clear();
    for (auto& tier : tiers) {
        auto name = tier.name;
        tiers_[name] = std::move(tier);
    }
    default_tier_ = std::move(default_tier);

    TOLLGATE_LOG_INFO(Quota, "Quota tiers loaded: {} tiers, default tier '{}'",
                      tiers_.size(), default_tier_.empty() ? "(unlimited)" : default_tier_);
}

void QuotaLedger::assign_tier(const std::string& tenant_id, const std::string& tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    assignments_[tenant_id] = tier;
    TOLLGATE_LOG_INFO(Quota, "Tenant {} assigned to tier {}", tenant_id, tier);
}

void QuotaLedger::set_assignments(std::unordered_map<std::string, std::string> assignments) {
    std::lock_guard<std::mutex> lock(mutex_);
    assignments_ = std::move(assignments);
}

std::string QuotaLedger::tier_of(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier_locked(tenant_id);
}

std::optional<QuotaLimit> QuotaLedger::limit_for(const std::string& tenant_id, Resource resource) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_locked(tenant_id, resource);
}

std::string QuotaLedger::tier_locked(const std::string& tenant_id) const {
    auto it = assignments_.find(tenant_id);
    return it != assignments_.end() ? it->second : default_tier_;
}

std::optional<QuotaLimit> QuotaLedger::limit_locked(const std::string& tenant_id, Resource resource) const {
    auto policy = policies_.find(CounterKey{tenant_id, resource});
    if (policy != policies_.end()) {
        return policy->second;
    }

    auto tier = tiers_.find(tier_locked(tenant_id));
    if (tier == tiers_.end()) {
        return std::nullopt;
    }

    auto limit = tier->second.limits.find(resource);
    if (limit == tier->second.limits.end()) {
        return std::nullopt;
    }
    return limit->second;
}

std::uint64_t QuotaLedger::consumed_locked(const CounterKey& key, const std::optional<QuotaLimit>& limit,
                                           Clock::time_point now) const {
    auto it = counters_.find(key);
    if (it == counters_.end()) {
        return 0;
    }
    if (limit && limit->window && now - it->second.window_start >= *limit->window) {
        return 0;
    }
    return it->second.consumed;
}

QuotaDecision QuotaLedger::decide_locked(const std::string& tenant_id, Resource resource,
                                         std::uint64_t amount, Clock::time_point now) const {
    CounterKey key{tenant_id, resource};
    auto limit = limit_locked(tenant_id, resource);

    QuotaDecision decision;
    decision.resource = resource;
    decision.current = consumed_locked(key, limit, now);

    if (!limit) {
        decision.allowed = true;
        return decision;
    }

    decision.limit = limit->limit;

    // Written as a subtraction so huge amounts cannot overflow
    bool fits = decision.current <= limit->limit && amount <= limit->limit - decision.current;
    if (!fits) {
        decision.allowed = false;
        decision.reason = fmt::format("Quota exceeded: {} limit is {}, current usage is {}, requested {}",
                                      to_string(resource), limit->limit, decision.current, amount);
    }
    return decision;
}

} // namespace tollgate::quota
