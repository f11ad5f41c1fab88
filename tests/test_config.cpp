#include <catch2/catch_test_macros.hpp>
#include "config/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace tollgate;
using namespace tollgate::config;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kEnvVars = {
    "TOLLGATE_CONFIG", "TOLLGATE_CACHE_MAX_ENTRIES", "TOLLGATE_CACHE_MAX_BYTES", "TOLLGATE_CACHE_TTL",
    "TOLLGATE_PRUNE_ENABLED", "TOLLGATE_PRUNE_INTERVAL", "TOLLGATE_PRUNE_MAX_JOB_AGE_DAYS",
    "TOLLGATE_PRUNE_MAX_ARTIFACT_AGE_DAYS", "TOLLGATE_PRUNE_MAX_ARTIFACTS_PER_TENANT",
    "TOLLGATE_PRUNE_BATCH_SIZE", "TOLLGATE_PRUNE_DRY_RUN", "TOLLGATE_REGISTRY_ROOT",
    "TOLLGATE_LOG_LEVEL", "TOLLGATE_LOG_FILE"
};

// Clears TOLLGATE_* on entry and exit so tests see only what they set
struct CleanEnv {
    CleanEnv() { clear(); }
    ~CleanEnv() { clear(); }

    static void clear() {
        for (const auto& name : kEnvVars) {
            unsetenv(name.c_str());
        }
    }
};

// Writes a config file into a scratch directory removed on scope exit
struct TempConfig {
    fs::path dir;
    fs::path path;

    explicit TempConfig(const nlohmann::json& j) {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("tollgate_config_" + std::to_string(rd()));
        fs::create_directories(dir);
        path = dir / "tollgate.json";
        write(j);
    }

    ~TempConfig() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const nlohmann::json& j) const {
        std::ofstream out(path);
        out << j.dump(2);
    }
};

// argv built from strings, kept alive for the call
bool load(ConfigManager& manager, std::vector<std::string> args) {
    args.insert(args.begin(), "tollgated");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return manager.load(static_cast<int>(argv.size()), argv.data());
}

nlohmann::json sample_config() {
    return nlohmann::json::parse(R"({
        "cache": {"max_entries": 500, "max_bytes": 1048576, "default_ttl_seconds": 60},
        "quota": {
            "default_tier": "free",
            "tiers": {
                "free": {"jobs": 10, "cache_bytes": 1024,
                         "api_requests": {"limit": 60, "window_seconds": 60}},
                "pro": {"jobs": 100}
            },
            "tenants": {"bigco": "pro"}
        },
        "prune": {"interval_seconds": 3600, "max_job_age_days": 60, "max_artifact_age_days": 7,
                  "max_artifacts_per_tenant": 50, "batch_size": 25},
        "registry": {"kind": "memory"},
        "logging": {"level": "warn"}
    })");
}

} // namespace

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are valid", "[config]") {
    Config config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.cache.max_entries == 1000);
    REQUIRE(config.cache.default_ttl_seconds == 300);
    REQUIRE(config.prune.enabled);
    REQUIRE(config.prune.interval_seconds == 86400);
    REQUIRE(config.prune.max_job_age_days == 90);
    REQUIRE(config.prune.max_artifact_age_days == 30);
    REQUIRE(config.prune.batch_size == 100);
    REQUIRE_FALSE(config.prune.dry_run);
    REQUIRE(config.registry.kind == "memory");
    REQUIRE(config.quota.default_tier.empty());
}

// ── JSON ─────────────────────────────────────────────────────────

TEST_CASE("Config: parses every section from JSON", "[config][json]") {
    auto config = sample_config().get<Config>();
    REQUIRE_NOTHROW(config.validate());

    REQUIRE(config.cache.max_entries == 500);
    REQUIRE(config.cache.default_ttl_seconds == 60);
    REQUIRE(config.quota.default_tier == "free");
    REQUIRE(config.quota.tiers.at("free").at("jobs").limit == 10);
    REQUIRE_FALSE(config.quota.tiers.at("free").at("jobs").window_seconds.has_value());
    REQUIRE(config.quota.tiers.at("free").at("api_requests").window_seconds == 60);
    REQUIRE(config.quota.tenants.at("bigco") == "pro");
    REQUIRE(config.prune.batch_size == 25);
    REQUIRE(config.logging.level == "warn");
}

TEST_CASE("Config: missing keys keep defaults", "[config][json]") {
    auto config = nlohmann::json::parse(R"({"prune": {"dry_run": true}})").get<Config>();
    REQUIRE(config.prune.dry_run);
    REQUIRE(config.prune.batch_size == 100);
    REQUIRE(config.cache.max_entries == 1000);
}

TEST_CASE("Config: short aliases are accepted", "[config][json]") {
    auto config = nlohmann::json::parse(
        R"({"cache": {"default_ttl": 15}, "prune": {"interval": 120}})").get<Config>();
    REQUIRE(config.cache.default_ttl_seconds == 15);
    REQUIRE(config.prune.interval_seconds == 120);
}

TEST_CASE("Config: serializes back to the same settings", "[config][json]") {
    auto config = sample_config().get<Config>();
    nlohmann::json j = config;
    auto reparsed = j.get<Config>();
    REQUIRE(reparsed.cache == config.cache);
    REQUIRE(reparsed.quota == config.quota);
    REQUIRE(j["quota"]["tiers"]["free"]["jobs"] == 10);
    REQUIRE(j["quota"]["tiers"]["free"]["api_requests"]["window_seconds"] == 60);
}

// ── Validation ───────────────────────────────────────────────────

TEST_CASE("Config::validate: negative values are rejected", "[config][validate]") {
    Config config;

    SECTION("cache bound") {
        config.cache.max_bytes = -1;
    }
    SECTION("ttl") {
        config.cache.default_ttl_seconds = -5;
    }
    SECTION("job age") {
        config.prune.max_job_age_days = -1;
    }
    SECTION("artifact cap") {
        config.prune.max_artifacts_per_tenant = -10;
    }
    SECTION("quota limit") {
        config.quota.tiers["free"]["jobs"] = LimitSettings{-1, std::nullopt};
    }

    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("Config::validate: interval and batch size must be positive", "[config][validate]") {
    Config config;
    config.prune.interval_seconds = 0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = Config{};
    config.prune.batch_size = 0;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("Config::validate: tiers must be defined and resources known", "[config][validate]") {
    Config config;

    SECTION("undefined default tier") {
        config.quota.default_tier = "gold";
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("tenant assigned to undefined tier") {
        config.quota.tiers["free"] = {};
        config.quota.tenants["acme"] = "gold";
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("unknown resource") {
        config.quota.tiers["free"]["gpu_hours"] = LimitSettings{5, std::nullopt};
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("non-positive window") {
        config.quota.tiers["free"]["api_requests"] = LimitSettings{5, 0};
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    }
}

TEST_CASE("Config::validate: registry and logging", "[config][validate]") {
    Config config;

    SECTION("filesystem without root") {
        config.registry.kind = "filesystem";
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("unknown registry kind") {
        config.registry.kind = "s3";
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    }
    SECTION("unknown log level") {
        config.logging.level = "verbose";
        REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
    }
}

// ── Conversions ──────────────────────────────────────────────────

TEST_CASE("CacheSettings: zero ttl means no expiry", "[config][convert]") {
    CacheSettings settings;
    settings.default_ttl_seconds = 0;
    REQUIRE_FALSE(settings.to_store_config().default_ttl.has_value());

    settings.default_ttl_seconds = 30;
    REQUIRE(settings.to_store_config().default_ttl == std::chrono::milliseconds(30000));
}

TEST_CASE("QuotaSettings: tiers convert to policies with windows", "[config][convert]") {
    auto settings = sample_config().get<Config>().quota;
    auto tiers = settings.to_tier_policies();
    REQUIRE(tiers.size() == 2);

    auto free = std::find_if(tiers.begin(), tiers.end(),
                             [](const quota::TierPolicy& t) { return t.name == "free"; });
    REQUIRE(free != tiers.end());
    REQUIRE(free->limits.at(quota::Resource::jobs).limit == 10);
    REQUIRE(free->limits.at(quota::Resource::api_requests).window == std::chrono::seconds(60));

    settings.tiers["free"]["gpu_hours"] = LimitSettings{1, std::nullopt};
    REQUIRE_THROWS_AS(settings.to_tier_policies(), std::runtime_error);
}

TEST_CASE("PruneSettings: days convert to hours", "[config][convert]") {
    PruneSettings settings;
    settings.max_job_age_days = 2;
    settings.max_artifact_age_days = 0;
    settings.interval_seconds = 600;

    auto prune = settings.to_prune_config();
    REQUIRE(prune.max_job_age == std::chrono::hours(48));
    REQUIRE(prune.max_artifact_age == std::chrono::hours(0));
    REQUIRE(prune.interval == std::chrono::seconds(600));
    REQUIRE_NOTHROW(prune.validate());
}

TEST_CASE("LogSettings: level names map to log levels", "[config][convert]") {
    LogSettings settings;
    settings.level = "debug";
    REQUIRE(settings.to_log_config().level == util::LogLevel::Debug);

    settings.level = "loud";
    REQUIRE_THROWS_AS(settings.to_log_config(), std::runtime_error);
}

// ── ConfigManager ────────────────────────────────────────────────

TEST_CASE("ConfigManager: no arguments gives defaults", "[config][manager]") {
    CleanEnv env;
    ConfigManager manager;
    REQUIRE(load(manager, {}));
    REQUIRE(manager.get_config().cache.max_entries == 1000);
    REQUIRE_FALSE(manager.run_once());
}

TEST_CASE("ConfigManager: loads the file named by --config", "[config][manager]") {
    CleanEnv env;
    TempConfig file(sample_config());
    ConfigManager manager;
    REQUIRE(load(manager, {"--config", file.path.string()}));
    REQUIRE(manager.get_config().cache.max_entries == 500);
    REQUIRE(manager.get_config_path() == file.path);
}

TEST_CASE("ConfigManager: environment overrides the file", "[config][manager]") {
    CleanEnv env;
    TempConfig file(sample_config());
    setenv("TOLLGATE_CONFIG", file.path.string().c_str(), 1);
    setenv("TOLLGATE_CACHE_MAX_ENTRIES", "42", 1);
    setenv("TOLLGATE_PRUNE_DRY_RUN", "true", 1);
    setenv("TOLLGATE_PRUNE_INTERVAL", "900", 1);

    ConfigManager manager;
    REQUIRE(load(manager, {}));
    auto config = manager.get_config();
    REQUIRE(config.cache.max_entries == 42);
    REQUIRE(config.prune.dry_run);
    REQUIRE(config.prune.interval_seconds == 900);
    REQUIRE(config.prune.batch_size == 25);
}

TEST_CASE("ConfigManager: malformed environment values are errors", "[config][manager]") {
    CleanEnv env;
    setenv("TOLLGATE_PRUNE_BATCH_SIZE", "lots", 1);
    ConfigManager manager;
    REQUIRE_THROWS_AS(load(manager, {}), std::runtime_error);
}

TEST_CASE("ConfigManager: command line overrides environment", "[config][manager]") {
    CleanEnv env;
    setenv("TOLLGATE_LOG_LEVEL", "error", 1);
    auto root = fs::temp_directory_path();

    ConfigManager manager;
    REQUIRE(load(manager, {"--dry-run", "--once", "--log-level=debug",
                           "--registry-root", root.string()}));
    auto config = manager.get_config();
    REQUIRE(config.prune.dry_run);
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.registry.kind == "filesystem");
    REQUIRE(config.registry.root == root.string());
    REQUIRE(manager.run_once());
}

TEST_CASE("ConfigManager: unknown option and --help", "[config][manager]") {
    CleanEnv env;
    ConfigManager manager;
    REQUIRE_THROWS_AS(load(manager, {"--frobnicate"}), std::runtime_error);

    ConfigManager help;
    REQUIRE_FALSE(load(help, {"--help"}));
}

TEST_CASE("ConfigManager: invalid file fails to load", "[config][manager]") {
    CleanEnv env;
    auto bad = sample_config();
    bad["prune"]["batch_size"] = 0;
    TempConfig file(bad);

    ConfigManager manager;
    REQUIRE_THROWS_AS(load(manager, {"-c", file.path.string()}), std::runtime_error);
    REQUIRE_THROWS_AS(load(manager, {"--config=/nonexistent/tollgate.json"}), std::runtime_error);
}

TEST_CASE("ConfigManager: reload notifies on quota changes only", "[config][manager][reload]") {
    CleanEnv env;
    TempConfig file(sample_config());
    ConfigManager manager;
    REQUIRE(load(manager, {"--config", file.path.string(), "--dry-run"}));

    std::vector<QuotaSettings> seen;
    manager.on_reload([&](const QuotaSettings& quota) { seen.push_back(quota); });

    SECTION("unchanged quota") {
        auto changed = sample_config();
        changed["cache"]["max_entries"] = 7;
        file.write(changed);
        manager.reload();
        REQUIRE(seen.empty());
    }

    SECTION("changed quota") {
        auto changed = sample_config();
        changed["quota"]["tenants"]["acme"] = "pro";
        file.write(changed);
        manager.reload();
        REQUIRE(seen.size() == 1);
        REQUIRE(seen[0].tenants.at("acme") == "pro");
        // CLI overrides survive the reload
        REQUIRE(manager.get_config().prune.dry_run);
    }

    SECTION("invalid file keeps the previous configuration") {
        auto broken = sample_config();
        broken["quota"]["default_tier"] = "gold";
        file.write(broken);
        manager.reload();
        REQUIRE(seen.empty());
        REQUIRE(manager.get_config().quota.default_tier == "free");
    }
}
