#include <catch2/catch_test_macros.hpp>
#include "quota/quota_ledger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace tollgate::quota;
using namespace std::chrono_literals;

namespace {

QuotaPolicy policy(const std::string& tenant, Resource resource, std::uint64_t limit,
                   std::optional<std::chrono::seconds> window = std::nullopt) {
    QuotaPolicy p;
    p.tenant_id = tenant;
    p.resource = resource;
    p.limit = limit;
    p.window = window;
    return p;
}

} // namespace

// ── Resource names ───────────────────────────────────────────────

TEST_CASE("parse_resource: known names round trip through to_string", "[quota]") {
    for (auto resource : {Resource::jobs, Resource::artifacts, Resource::cache_bytes, Resource::api_requests}) {
        REQUIRE(parse_resource(to_string(resource)) == resource);
    }
    REQUIRE_FALSE(parse_resource("gpu_hours").has_value());
}

// ── Reserve / release ────────────────────────────────────────────

TEST_CASE("QuotaLedger: reserve at the limit is denied until released", "[quota]") {
    QuotaLedger ledger;
    ledger.set_policy(policy("acme", Resource::jobs, 5));
    for (int i = 0; i < 5; ++i) {
        REQUIRE(ledger.reserve("acme", Resource::jobs, 1).allowed);
    }

    auto denied = ledger.reserve("acme", Resource::jobs, 1);
    REQUIRE_FALSE(denied.allowed);
    REQUIRE(denied.current == 5);
    REQUIRE(denied.limit == 5u);
    REQUIRE(denied.resource == Resource::jobs);
    REQUIRE_FALSE(denied.reason.empty());

    ledger.release("acme", Resource::jobs, 1);
    REQUIRE(ledger.reserve("acme", Resource::jobs, 1).allowed);
    REQUIRE(ledger.usage("acme").at(Resource::jobs) == 5);
}

TEST_CASE("QuotaLedger: denied reservation does not change consumption", "[quota]") {
    QuotaLedger ledger;
    ledger.set_policy(policy("acme", Resource::artifacts, 100));
    REQUIRE(ledger.reserve("acme", Resource::artifacts, 60).allowed);
    REQUIRE_FALSE(ledger.reserve("acme", Resource::artifacts, 41).allowed);
    REQUIRE(ledger.usage("acme").at(Resource::artifacts) == 60);
}

TEST_CASE("QuotaLedger: check does not mutate", "[quota]") {
    QuotaLedger ledger;
    ledger.set_policy(policy("acme", Resource::jobs, 2));
    REQUIRE(ledger.check("acme", Resource::jobs, 2).allowed);
    REQUIRE_FALSE(ledger.check("acme", Resource::jobs, 3).allowed);
    REQUIRE(ledger.usage("acme").empty());
}

TEST_CASE("QuotaLedger: release floors at zero", "[quota]") {
    QuotaLedger ledger;
    ledger.reserve("acme", Resource::cache_bytes, 10);
    ledger.release("acme", Resource::cache_bytes, 25);
    REQUIRE(ledger.usage("acme").at(Resource::cache_bytes) == 0);

    // Unknown tenant is a no-op
    ledger.release("nobody", Resource::cache_bytes, 5);
    REQUIRE(ledger.usage("nobody").empty());
}

TEST_CASE("QuotaLedger: no limit means unlimited", "[quota]") {
    QuotaLedger ledger;
    auto decision = ledger.reserve("acme", Resource::artifacts, UINT64_MAX / 2);
    REQUIRE(decision.allowed);
    REQUIRE_FALSE(decision.limit.has_value());
}

TEST_CASE("QuotaLedger: huge amount cannot overflow past the limit", "[quota]") {
    QuotaLedger ledger;
    ledger.set_policy(policy("acme", Resource::cache_bytes, 100));
    ledger.reserve("acme", Resource::cache_bytes, 50);
    REQUIRE_FALSE(ledger.reserve("acme", Resource::cache_bytes, UINT64_MAX).allowed);
}

TEST_CASE("QuotaLedger: concurrent reservations never exceed the limit", "[quota][concurrency]") {
    QuotaLedger ledger;
    ledger.set_policy(policy("acme", Resource::jobs, 100));

    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (ledger.reserve("acme", Resource::jobs, 1)) {
                    ++granted;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(granted == 100);
    REQUIRE(ledger.usage("acme").at(Resource::jobs) == 100);
}

// ── Windows ──────────────────────────────────────────────────────

TEST_CASE("QuotaLedger: windowed consumption resets when the window elapses", "[quota][window]") {
    QuotaLedger ledger;
    ledger.set_policy(policy("acme", Resource::api_requests, 2, 1s));
    REQUIRE(ledger.reserve("acme", Resource::api_requests, 2).allowed);
    REQUIRE_FALSE(ledger.reserve("acme", Resource::api_requests, 1).allowed);

    std::this_thread::sleep_for(1100ms);
    REQUIRE(ledger.check("acme", Resource::api_requests, 2).allowed);
    REQUIRE(ledger.reserve("acme", Resource::api_requests, 1).allowed);
    REQUIRE(ledger.usage("acme").at(Resource::api_requests) == 1);
}

// ── Tiers and policies ───────────────────────────────────────────

TEST_CASE("QuotaLedger: tenant limits come from its tier", "[quota][tier]") {
    QuotaLedger ledger;
    TierPolicy free{"free", {{Resource::jobs, QuotaLimit{2, std::nullopt}}}};
    TierPolicy pro{"pro", {{Resource::jobs, QuotaLimit{10, std::nullopt}}}};
    ledger.set_tiers({free, pro}, "free");
    ledger.assign_tier("bigco", "pro");

    REQUIRE(ledger.tier_of("acme") == "free");
    REQUIRE(ledger.tier_of("bigco") == "pro");
    REQUIRE(ledger.limit_for("acme", Resource::jobs)->limit == 2);
    REQUIRE(ledger.limit_for("bigco", Resource::jobs)->limit == 10);
    REQUIRE_FALSE(ledger.limit_for("acme", Resource::artifacts).has_value());

    REQUIRE_FALSE(ledger.check("acme", Resource::jobs, 3).allowed);
    REQUIRE(ledger.check("bigco", Resource::jobs, 3).allowed);
}

TEST_CASE("QuotaLedger: explicit policy overrides the tier", "[quota][tier]") {
    QuotaLedger ledger;
    ledger.set_tiers({TierPolicy{"free", {{Resource::jobs, QuotaLimit{2, std::nullopt}}}}}, "free");
    ledger.set_policy(policy("acme", Resource::jobs, 7));
    REQUIRE(ledger.limit_for("acme", Resource::jobs)->limit == 7);

    REQUIRE(ledger.remove_policy("acme", Resource::jobs));
    REQUIRE(ledger.limit_for("acme", Resource::jobs)->limit == 2);
    REQUIRE_FALSE(ledger.remove_policy("acme", Resource::jobs));
}

TEST_CASE("QuotaLedger: set_assignments replaces previous assignments", "[quota][tier]") {
    QuotaLedger ledger;
    ledger.set_tiers({TierPolicy{"free", {}}, TierPolicy{"pro", {}}}, "free");
    ledger.assign_tier("acme", "pro");
    ledger.set_assignments({{"bigco", "pro"}});

    REQUIRE(ledger.tier_of("acme") == "free");
    REQUIRE(ledger.tier_of("bigco") == "pro");
}

TEST_CASE("QuotaLedger: lowered limit keeps consumption and denies new reservations", "[quota][tier]") {
    QuotaLedger ledger;
    ledger.set_policy(policy("acme", Resource::jobs, 10));
    ledger.reserve("acme", Resource::jobs, 8);
    ledger.set_policy(policy("acme", Resource::jobs, 5));

    REQUIRE(ledger.usage("acme").at(Resource::jobs) == 8);
    REQUIRE_FALSE(ledger.reserve("acme", Resource::jobs, 1).allowed);
    ledger.release("acme", Resource::jobs, 4);
    REQUIRE(ledger.reserve("acme", Resource::jobs, 1).allowed);
}

// ── Snapshot ─────────────────────────────────────────────────────

TEST_CASE("QuotaLedger: snapshot reports consumption against limits", "[quota]") {
    QuotaLedger ledger;
    ledger.set_policy(policy("acme", Resource::jobs, 4));
    ledger.reserve("acme", Resource::jobs, 1);
    ledger.reserve("bigco", Resource::artifacts, 500);

    auto summaries = ledger.snapshot();
    REQUIRE(summaries.size() == 2);

    auto acme = std::find_if(summaries.begin(), summaries.end(),
                             [](const UsageSummary& s) { return s.tenant_id == "acme"; });
    REQUIRE(acme != summaries.end());
    REQUIRE(acme->consumed == 1);
    REQUIRE(acme->limit == 4u);
    REQUIRE(acme->utilization_percent() == 25.0);
    REQUIRE(acme->remaining() == 3);

    auto bigco = std::find_if(summaries.begin(), summaries.end(),
                              [](const UsageSummary& s) { return s.tenant_id == "bigco"; });
    REQUIRE(bigco != summaries.end());
    REQUIRE_FALSE(bigco->limit.has_value());
    REQUIRE(bigco->remaining() == UINT64_MAX);
}
