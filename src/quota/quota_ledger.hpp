/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Quota Ledger - Per-tenant resource accounting with check-before-commit enforcement
 *
 * Limits come from, in order of precedence:
 * 1. An explicit per-tenant QuotaPolicy
 * 2. The tenant's tier (or the default tier)
 * 3. Nothing - the resource is unlimited
 */

#ifndef TOLLGATE_QUOTA_QUOTA_LEDGER_HPP
#define TOLLGATE_QUOTA_QUOTA_LEDGER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tollgate::quota {

using Clock = std::chrono::steady_clock;

/**
 * Resources tracked per tenant
 */
enum class Resource {
    jobs,          // Job count
    artifacts,     // Artifact bytes
    cache_bytes,   // Bytes held in the result cache
    api_requests   // Request count, usually windowed
};

std::string_view to_string(Resource resource);

/**
 * Parse a resource name ("jobs", "artifacts", "cache_bytes", "api_requests")
 */
std::optional<Resource> parse_resource(std::string_view name);

/**
 * A limit for one resource, with an optional fixed accounting window
 */
struct QuotaLimit {
    std::uint64_t limit{0};
    std::optional<std::chrono::seconds> window;

    bool operator==(const QuotaLimit&) const = default;
};

/**
 * Limit for one (tenant, resource). Immutable once issued; replace it to change limits.
 */
struct QuotaPolicy {
    std::string tenant_id;
    Resource resource{Resource::jobs};
    std::uint64_t limit{0};
    std::optional<std::chrono::seconds> window;
};

/**
 * Limits for a named tier ("free", "starter", ...)
 */
struct TierPolicy {
    std::string name;
    std::map<Resource, QuotaLimit> limits;

    bool operator==(const TierPolicy&) const = default;
};

/**
 * Consumption for one (tenant, resource)
 */
struct UsageCounter {
    std::string tenant_id;
    Resource resource{Resource::jobs};
    std::uint64_t consumed{0};
    Clock::time_point updated_at;
    Clock::time_point window_start;
};

/**
 * Result of check() / reserve(). Denied is an expected outcome, not an error.
 */
struct QuotaDecision {
    bool allowed{true};
    Resource resource{Resource::jobs};
    std::uint64_t current{0};
    std::optional<std::uint64_t> limit;   // nullopt = unlimited
    std::string reason;

    explicit operator bool() const noexcept { return allowed; }
};

/**
 * Usage summary for reporting
 */
struct UsageSummary {
    std::string tenant_id;
    std::string tier;
    Resource resource{Resource::jobs};
    std::uint64_t consumed{0};
    std::optional<std::uint64_t> limit;

    double utilization_percent() const {
        if (!limit || *limit == 0) return 0.0;
        return static_cast<double>(consumed) * 100.0 / static_cast<double>(*limit);
    }

    std::uint64_t remaining() const {
        if (!limit) return UINT64_MAX;
        return consumed >= *limit ? 0 : *limit - consumed;
    }
};

/**
 * Per-tenant quota ledger
 *
 * All operations take one mutex, so reserve() checks and commits as a single
 * step: two concurrent reservations can never both succeed when their sum
 * would exceed the limit.
 */
class QuotaLedger {
public:
    QuotaLedger() = default;

    // Non-copyable
    QuotaLedger(const QuotaLedger&) = delete;
    QuotaLedger& operator=(const QuotaLedger&) = delete;

    /**
     * Would consumed + amount stay within the active limit? Does not mutate.
     */
    QuotaDecision check(const std::string& tenant_id, Resource resource, std::uint64_t amount) const;

    /**
     * Atomically check and, if allowed, commit the increment
     */
    QuotaDecision reserve(const std::string& tenant_id, Resource resource, std::uint64_t amount);

    /**
     * Decrement consumption, floored at zero
     */
    void release(const std::string& tenant_id, Resource resource, std::uint64_t amount);

    /**
     * Snapshot of consumption per resource for a tenant
     */
    std::map<Resource, std::uint64_t> usage(const std::string& tenant_id) const;

    /**
     * Consumption against limits for every tracked or assigned tenant
     */
    std::vector<UsageSummary> snapshot() const;

    /**
     * Install or replace a per-tenant policy (replaced wholesale)
     */
    void set_policy(const QuotaPolicy& policy);

    /**
     * Remove a per-tenant policy, falling back to the tier limit
     */
    bool remove_policy(const std::string& tenant_id, Resource resource);

    /**
     * Replace all tier definitions
     */
    void set_tiers(std::vector<TierPolicy> tiers, std::string default_tier);

    /**
     * Assign a tenant to a tier
     */
    void assign_tier(const std::string& tenant_id, const std::string& tier);

    /**
     * Replace all tenant tier assignments
     */
    void set_assignments(std::unordered_map<std::string, std::string> assignments);

    /**
     * Tier the tenant resolves to (empty if none)
     */
    std::string tier_of(const std::string& tenant_id) const;

    /**
     * Active limit for (tenant, resource), nullopt = unlimited
     */
    std::optional<QuotaLimit> limit_for(const std::string& tenant_id, Resource resource) const;

private:
    using CounterKey = std::pair<std::string, Resource>;

    struct CounterKeyHash {
        std::size_t operator()(const CounterKey& key) const noexcept {
            return std::hash<std::string>{}(key.first) ^
                   (static_cast<std::size_t>(key.second) * 0x9e3779b97f4a7c15ULL);
        }
    };

    std::optional<QuotaLimit> limit_locked(const std::string& tenant_id, Resource resource) const;
    std::string tier_locked(const std::string& tenant_id) const;

    /**
     * Current consumption, treating an elapsed window as zero
     */
    std::uint64_t consumed_locked(const CounterKey& key, const std::optional<QuotaLimit>& limit,
                                  Clock::time_point now) const;

    QuotaDecision decide_locked(const std::string& tenant_id, Resource resource,
                                std::uint64_t amount, Clock::time_point now) const;

    mutable std::mutex mutex_;
    std::unordered_map<CounterKey, UsageCounter, CounterKeyHash> counters_;
    std::unordered_map<CounterKey, QuotaLimit, CounterKeyHash> policies_;
    std::unordered_map<std::string, TierPolicy> tiers_;
    std::unordered_map<std::string, std::string> assignments_;
    std::string default_tier_;
};

} // namespace tollgate::quota

#endif // TOLLGATE_QUOTA_QUOTA_LEDGER_HPP
