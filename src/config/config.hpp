/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Configuration System - Supports JSON file, environment variables, and CLI args
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Command-line arguments
 * 2. Environment variables (TOLLGATE_*)
 * 3. Configuration file (JSON)
 * 4. Default values
 */

#ifndef TOLLGATE_CONFIG_CONFIG_HPP
#define TOLLGATE_CONFIG_CONFIG_HPP

#include "cache/cache_store.hpp"
#include "quota/quota_ledger.hpp"
#include "retention/registry.hpp"
#include "retention/retention_scheduler.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::config {

/**
 * Result cache configuration
 */
struct CacheSettings {
    std::int64_t max_entries{1000};                // 0 = unbounded
    std::int64_t max_bytes{100 * 1024 * 1024};     // 0 = unbounded
    std::int64_t default_ttl_seconds{300};         // 0 = no expiry

    cache::CacheStoreConfig to_store_config() const;

    bool operator==(const CacheSettings&) const = default;
};

/**
 * One resource limit within a tier. In JSON either a bare number or
 * {"limit": N, "window_seconds": W}.
 */
struct LimitSettings {
    std::int64_t limit{0};
    std::optional<std::int64_t> window_seconds;

    bool operator==(const LimitSettings&) const = default;
};

/**
 * Quota tiers and tenant assignments
 */
struct QuotaSettings {
    std::string default_tier;                                           // Empty = unlimited
    std::map<std::string, std::map<std::string, LimitSettings>> tiers;  // tier -> resource -> limit
    std::map<std::string, std::string> tenants;                         // tenant -> tier

    /**
     * @throws std::runtime_error for unknown resource names
     */
    std::vector<quota::TierPolicy> to_tier_policies() const;

    bool operator==(const QuotaSettings&) const = default;
};

/**
 * Retention configuration
 */
struct PruneSettings {
    bool enabled{true};
    std::int64_t interval_seconds{24 * 3600};
    std::int64_t max_job_age_days{90};
    std::int64_t max_artifact_age_days{30};
    std::int64_t max_artifacts_per_tenant{1000};   // 0 = no cap
    std::int64_t batch_size{100};
    bool dry_run{false};
    std::int64_t history_size{20};
    std::int64_t shutdown_grace_seconds{30};

    retention::PruneConfig to_prune_config() const;
};

/**
 * Job/artifact registry provider
 */
struct RegistrySettings {
    std::string kind{"memory"};    // memory | filesystem
    std::string root;

    retention::RegistryConfig to_registry_config() const;
};

/**
 * Service host configuration
 */
struct ServiceSettings {
    std::size_t threads{1};        // 0 = hardware_concurrency
};

/**
 * Logging configuration
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;              // Empty = stdout only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};

    /**
     * @throws std::runtime_error for an unknown level name
     */
    util::LogConfig to_log_config() const;
};

/**
 * Complete application configuration
 */
struct Config {
    CacheSettings cache;
    QuotaSettings quota;
    PruneSettings prune;
    RegistrySettings registry;
    ServiceSettings service;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;
};

/**
 * Called with the new quota settings when a reload changed them
 */
using ConfigReloadCallback = std::function<void(const QuotaSettings&)>;

/**
 * Configuration manager - handles loading, parsing, and hot-reload
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Parse command-line arguments and load configuration
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return true if configuration loaded successfully, false if --help was requested
     * @throws std::runtime_error on configuration errors
     */
    bool load(int argc, char* argv[]);

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Reload configuration from file (called on SIGHUP)
     * Only quota tiers and tenant assignments take effect; other settings require restart.
     */
    void reload();

    /**
     * Register callback for configuration reload events
     */
    void on_reload(ConfigReloadCallback callback);

    /**
     * Get the configuration file path
     */
    std::filesystem::path get_config_path() const;

    /**
     * True if --once was given: run a single prune cycle and exit
     */
    bool run_once() const noexcept { return run_once_; }

    /**
     * Print help message to stdout
     */
    static void print_help(const char* program_name);

private:
    /**
     * Load configuration from JSON file
     */
    void load_from_file(const std::filesystem::path& path);

    /**
     * Apply environment variable overrides
     */
    void apply_environment_overrides();

    /**
     * Apply command-line argument overrides
     */
    void apply_cli_overrides(int argc, char* argv[]);

    /**
     * Re-apply stored CLI overrides after a reload
     */
    void reapply_cli_overrides();

    /**
     * Get environment variable value
     */
    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
    std::vector<ConfigReloadCallback> reload_callbacks_;
    bool run_once_{false};

    // CLI overrides (stored to preserve precedence on reload)
    std::optional<bool> cli_dry_run_;
    std::optional<std::string> cli_registry_root_;
    std::optional<std::string> cli_log_level_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const CacheSettings& c);
void from_json(const nlohmann::json& j, CacheSettings& c);
void to_json(nlohmann::json& j, const LimitSettings& l);
void from_json(const nlohmann::json& j, LimitSettings& l);
void to_json(nlohmann::json& j, const QuotaSettings& q);
void from_json(const nlohmann::json& j, QuotaSettings& q);
void to_json(nlohmann::json& j, const PruneSettings& p);
void from_json(const nlohmann::json& j, PruneSettings& p);
void to_json(nlohmann::json& j, const RegistrySettings& r);
void from_json(const nlohmann::json& j, RegistrySettings& r);
void to_json(nlohmann::json& j, const ServiceSettings& s);
void from_json(const nlohmann::json& j, ServiceSettings& s);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace tollgate::config

#endif // TOLLGATE_CONFIG_CONFIG_HPP
