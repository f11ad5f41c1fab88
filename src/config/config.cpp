/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace tollgate::config {

namespace log_component = util::log_component;

namespace {

std::int64_t parse_int(const std::string& name, const std::string& value) {
    try {
        std::size_t pos = 0;
        auto result = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid " + name + " value: " + value);
    }
}

bool parse_bool(const std::string& name, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    throw std::runtime_error("Invalid " + name + " value: " + value);
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error("Configuration error: " + message);
    }
}

} // namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const CacheSettings& c) {
    j = nlohmann::json{
        {"max_entries", c.max_entries},
        {"max_bytes", c.max_bytes},
        {"default_ttl_seconds", c.default_ttl_seconds}
    };
}

void from_json(const nlohmann::json& j, CacheSettings& c) {
    if (j.contains("max_entries")) j.at("max_entries").get_to(c.max_entries);
    if (j.contains("max_bytes")) j.at("max_bytes").get_to(c.max_bytes);
    if (j.contains("default_ttl_seconds")) j.at("default_ttl_seconds").get_to(c.default_ttl_seconds);
    if (j.contains("default_ttl")) j.at("default_ttl").get_to(c.default_ttl_seconds);
}

void to_json(nlohmann::json& j, const LimitSettings& l) {
    if (!l.window_seconds) {
        j = l.limit;
        return;
    }
    j = nlohmann::json{
        {"limit", l.limit},
        {"window_seconds", *l.window_seconds}
    };
}

void from_json(const nlohmann::json& j, LimitSettings& l) {
    if (j.is_number()) {
        j.get_to(l.limit);
        return;
    }
    if (!j.is_object()) {
        throw std::runtime_error("Configuration error: quota limit must be a number or an object");
    }
    if (j.contains("limit")) j.at("limit").get_to(l.limit);
    if (j.contains("window_seconds")) l.window_seconds = j.at("window_seconds").get<std::int64_t>();
}

void to_json(nlohmann::json& j, const QuotaSettings& q) {
    j = nlohmann::json{
        {"default_tier", q.default_tier},
        {"tiers", q.tiers},
        {"tenants", q.tenants}
    };
}

void from_json(const nlohmann::json& j, QuotaSettings& q) {
    if (j.contains("default_tier")) j.at("default_tier").get_to(q.default_tier);
    if (j.contains("tiers")) j.at("tiers").get_to(q.tiers);
    if (j.contains("tenants")) j.at("tenants").get_to(q.tenants);
}

void to_json(nlohmann::json& j, const PruneSettings& p) {
    j = nlohmann::json{
        {"enabled", p.enabled},
        {"interval_seconds", p.interval_seconds},
        {"max_job_age_days", p.max_job_age_days},
        {"max_artifact_age_days", p.max_artifact_age_days},
        {"max_artifacts_per_tenant", p.max_artifacts_per_tenant},
        {"batch_size", p.batch_size},
        {"dry_run", p.dry_run},
        {"history_size", p.history_size},
        {"shutdown_grace_seconds", p.shutdown_grace_seconds}
    };
}

void from_json(const nlohmann::json& j, PruneSettings& p) {
    if (j.contains("enabled")) j.at("enabled").get_to(p.enabled);
    if (j.contains("interval_seconds")) j.at("interval_seconds").get_to(p.interval_seconds);
    if (j.contains("interval")) j.at("interval").get_to(p.interval_seconds);
    if (j.contains("max_job_age_days")) j.at("max_job_age_days").get_to(p.max_job_age_days);
    if (j.contains("max_artifact_age_days")) j.at("max_artifact_age_days").get_to(p.max_artifact_age_days);
    if (j.contains("max_artifacts_per_tenant")) j.at("max_artifacts_per_tenant").get_to(p.max_artifacts_per_tenant);
    if (j.contains("batch_size")) j.at("batch_size").get_to(p.batch_size);
    if (j.contains("dry_run")) j.at("dry_run").get_to(p.dry_run);
    if (j.contains("history_size")) j.at("history_size").get_to(p.history_size);
    if (j.contains("shutdown_grace_seconds")) j.at("shutdown_grace_seconds").get_to(p.shutdown_grace_seconds);
}

void to_json(nlohmann::json& j, const RegistrySettings& r) {
    j = nlohmann::json{
        {"kind", r.kind},
        {"root", r.root}
    };
}

void from_json(const nlohmann::json& j, RegistrySettings& r) {
    if (j.contains("kind")) j.at("kind").get_to(r.kind);
    if (j.contains("root")) j.at("root").get_to(r.root);
}

void to_json(nlohmann::json& j, const ServiceSettings& s) {
    j = nlohmann::json{
        {"threads", s.threads}
    };
}

void from_json(const nlohmann::json& j, ServiceSettings& s) {
    if (j.contains("threads")) j.at("threads").get_to(s.threads);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"cache", c.cache},
        {"quota", c.quota},
        {"prune", c.prune},
        {"registry", c.registry},
        {"service", c.service},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("quota")) j.at("quota").get_to(c.quota);
    if (j.contains("prune")) j.at("prune").get_to(c.prune);
    if (j.contains("registry")) j.at("registry").get_to(c.registry);
    if (j.contains("service")) j.at("service").get_to(c.service);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

// Conversions to component configuration
cache::CacheStoreConfig CacheSettings::to_store_config() const {
    cache::CacheStoreConfig store;
    store.max_entries = static_cast<std::size_t>(max_entries);
    store.max_bytes = static_cast<std::size_t>(max_bytes);
    if (default_ttl_seconds > 0) {
        store.default_ttl = std::chrono::seconds(default_ttl_seconds);
    } else {
        store.default_ttl = std::nullopt;
    }
    return store;
}

std::vector<quota::TierPolicy> QuotaSettings::to_tier_policies() const {
    std::vector<quota::TierPolicy> policies;
    policies.reserve(tiers.size());

    for (const auto& [name, limits] : tiers) {
        quota::TierPolicy tier;
        tier.name = name;
        for (const auto& [resource_name, limit] : limits) {
            auto resource = quota::parse_resource(resource_name);
            if (!resource) {
                throw std::runtime_error("Configuration error: unknown quota resource '" +
                                         resource_name + "' in tier " + name);
            }
            quota::QuotaLimit quota_limit;
            quota_limit.limit = static_cast<std::uint64_t>(limit.limit);
            if (limit.window_seconds) {
                quota_limit.window = std::chrono::seconds(*limit.window_seconds);
            }
            tier.limits[*resource] = quota_limit;
        }
        policies.push_back(std::move(tier));
    }
    return policies;
}

retention::PruneConfig PruneSettings::to_prune_config() const {
    retention::PruneConfig config;
    config.enabled = enabled;
    config.interval = std::chrono::seconds(interval_seconds);
    config.max_job_age = std::chrono::hours(max_job_age_days * 24);
    config.max_artifact_age = std::chrono::hours(max_artifact_age_days * 24);
    config.max_artifacts_per_tenant = static_cast<std::size_t>(max_artifacts_per_tenant);
    config.batch_size = static_cast<std::size_t>(batch_size);
    config.dry_run = dry_run;
    config.history_size = static_cast<std::size_t>(history_size);
    config.shutdown_grace = std::chrono::seconds(shutdown_grace_seconds);
    return config;
}

retention::RegistryConfig RegistrySettings::to_registry_config() const {
    return retention::RegistryConfig{kind, root};
}

util::LogConfig LogSettings::to_log_config() const {
    auto parsed = util::Logger::parse_level(level);
    if (!parsed) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + level + "'");
    }

    util::LogConfig config;
    config.level = *parsed;
    config.file_path = file;
    config.max_file_size_mb = max_file_size_mb;
    config.max_files = max_files;
    config.enable_console = enable_console;
    config.enable_colors = enable_colors;
    return config;
}

// Config validation
void Config::validate() const {
    // Cache settings
    require(cache.max_entries >= 0, "cache.max_entries must not be negative");
    require(cache.max_bytes >= 0, "cache.max_bytes must not be negative");
    require(cache.default_ttl_seconds >= 0, "cache.default_ttl_seconds must not be negative");

    // Quota settings
    for (const auto& [name, limits] : quota.tiers) {
        for (const auto& [resource, limit] : limits) {
            auto field = "quota.tiers." + name + "." + resource;
            require(quota::parse_resource(resource).has_value(), "unknown quota resource in " + field);
            require(limit.limit >= 0, field + " must not be negative");
            require(!limit.window_seconds || *limit.window_seconds > 0,
                    field + ".window_seconds must be positive");
        }
    }
    require(quota.default_tier.empty() || quota.tiers.contains(quota.default_tier),
            "quota.default_tier '" + quota.default_tier + "' is not defined");
    for (const auto& [tenant, tier] : quota.tenants) {
        require(quota.tiers.contains(tier),
                "quota.tenants." + tenant + " refers to undefined tier '" + tier + "'");
    }

    // Prune settings
    require(prune.interval_seconds > 0, "prune.interval_seconds must be positive");
    require(prune.batch_size > 0, "prune.batch_size must be positive");
    require(prune.max_job_age_days >= 0, "prune.max_job_age_days must not be negative");
    require(prune.max_artifact_age_days >= 0, "prune.max_artifact_age_days must not be negative");
    require(prune.max_artifacts_per_tenant >= 0, "prune.max_artifacts_per_tenant must not be negative");
    require(prune.history_size >= 0, "prune.history_size must not be negative");
    require(prune.shutdown_grace_seconds >= 0, "prune.shutdown_grace_seconds must not be negative");

    // Registry settings
    require(registry.kind == "memory" || registry.kind == "filesystem",
            "registry.kind must be 'memory' or 'filesystem'");
    require(registry.kind != "filesystem" || !registry.root.empty(),
            "registry.root is required for the filesystem registry");

    // Logging settings
    require(util::Logger::parse_level(logging.level).has_value(),
            "unknown logging.level '" + logging.level + "'");

    TOLLGATE_LOG_DEBUG(log_component::Config, "Configuration validated successfully");
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

bool ConfigManager::load(int argc, char* argv[]) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};

    // First pass: look for --help or --config
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return false;
        }

        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path_ = argv[++i];
        } else if (arg.starts_with("--config=")) {
            config_path_ = arg.substr(9);
        } else if (arg.starts_with("-c=")) {
            config_path_ = arg.substr(3);
        }
    }

    // Load from config file if specified
    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    // Apply environment variable overrides
    apply_environment_overrides();

    // Apply CLI overrides (highest precedence)
    apply_cli_overrides(argc, argv);

    // Validate final configuration
    config_.validate();

    TOLLGATE_LOG_INFO(log_component::Config, "Configuration loaded successfully");
    return true;
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ConfigManager::reload() {
    std::lock_guard<std::mutex> lock(config_mutex_);

    if (config_path_.empty()) {
        TOLLGATE_LOG_WARN(log_component::Config, "No configuration file specified, reload skipped");
        return;
    }

    TOLLGATE_LOG_INFO(log_component::Config, "Reloading configuration from {}", config_path_.string());

    auto previous = config_;
    try {
        load_from_file(config_path_);
        apply_environment_overrides();
        reapply_cli_overrides();
        config_.validate();
    } catch (const std::exception& e) {
        TOLLGATE_LOG_ERROR(log_component::Config, "Configuration reload failed, keeping previous configuration: {}", e.what());
        config_ = previous;
        return;
    }

    // Only quota settings are applied at runtime
    if (config_.quota != previous.quota) {
        TOLLGATE_LOG_INFO(log_component::Config, "Quota configuration changed, notifying {} listeners",
                          reload_callbacks_.size());
        for (const auto& callback : reload_callbacks_) {
            callback(config_.quota);
        }
    } else {
        TOLLGATE_LOG_INFO(log_component::Config, "Configuration reloaded, no quota changes");
    }
}

void ConfigManager::on_reload(ConfigReloadCallback callback) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    reload_callbacks_.push_back(std::move(callback));
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::print_help(const char* program_name) {
    std::cout << "TOLLGATE - Query Result Cache & Retention Governor\n"
              << "\n"
              << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                 Show this help message and exit\n"
              << "  -c, --config FILE          Path to JSON configuration file\n"
              << "  --dry-run                  Report prune candidates without deleting\n"
              << "  --once                     Run one prune cycle, print its stats as JSON and exit\n"
              << "  --registry-root DIR        Use the filesystem registry rooted at DIR\n"
              << "  --log-level LEVEL          Log level (trace/debug/info/warn/error/critical/off)\n"
              << "\n"
              << "Environment Variables:\n"
              << "  TOLLGATE_CONFIG                          Path to configuration file\n"
              << "  TOLLGATE_CACHE_MAX_ENTRIES               Cache entry bound (0 = unbounded)\n"
              << "  TOLLGATE_CACHE_MAX_BYTES                 Cache byte bound (0 = unbounded)\n"
              << "  TOLLGATE_CACHE_TTL                       Default TTL in seconds (0 = no expiry)\n"
              << "  TOLLGATE_PRUNE_ENABLED                   Enable/disable pruning (true/false)\n"
              << "  TOLLGATE_PRUNE_INTERVAL                  Seconds between prune cycles\n"
              << "  TOLLGATE_PRUNE_MAX_JOB_AGE_DAYS          Job retention in days\n"
              << "  TOLLGATE_PRUNE_MAX_ARTIFACT_AGE_DAYS     Artifact retention in days\n"
              << "  TOLLGATE_PRUNE_MAX_ARTIFACTS_PER_TENANT  Artifacts kept per tenant\n"
              << "  TOLLGATE_PRUNE_BATCH_SIZE                Deletions per batch\n"
              << "  TOLLGATE_PRUNE_DRY_RUN                   Report only (true/false)\n"
              << "  TOLLGATE_REGISTRY_ROOT                   Filesystem registry root\n"
              << "  TOLLGATE_LOG_LEVEL                       Log level\n"
              << "  TOLLGATE_LOG_FILE                        Log file path (stdout if not set)\n"
              << "\n"
              << "Configuration Precedence (highest to lowest):\n"
              << "  1. Command-line arguments\n"
              << "  2. Environment variables\n"
              << "  3. Configuration file\n"
              << "  4. Default values\n"
              << "\n"
              << "Configuration File Format (JSON):\n"
              << "  {\n"
              << "    \"cache\": {\n"
              << "      \"max_entries\": 1000,\n"
              << "      \"max_bytes\": 104857600,\n"
              << "      \"default_ttl_seconds\": 300\n"
              << "    },\n"
              << "    \"quota\": {\n"
              << "      \"default_tier\": \"free\",\n"
              << "      \"tiers\": {\n"
              << "        \"free\": {\"jobs\": 10, \"cache_bytes\": 10485760,\n"
              << "                 \"api_requests\": {\"limit\": 60, \"window_seconds\": 60}}\n"
              << "      },\n"
              << "      \"tenants\": {\"acme\": \"free\"}\n"
              << "    },\n"
              << "    \"prune\": {\n"
              << "      \"enabled\": true,\n"
              << "      \"interval_seconds\": 86400,\n"
              << "      \"max_job_age_days\": 90,\n"
              << "      \"max_artifact_age_days\": 30,\n"
              << "      \"max_artifacts_per_tenant\": 1000,\n"
              << "      \"batch_size\": 100,\n"
              << "      \"dry_run\": false\n"
              << "    },\n"
              << "    \"registry\": {\"kind\": \"filesystem\", \"root\": \"/var/lib/tollgate\"},\n"
              << "    \"service\": {\"threads\": 1},\n"
              << "    \"logging\": {\"level\": \"info\", \"file\": \"\"}\n"
              << "  }\n"
              << "\n"
              << "Send SIGHUP to reload quota tiers and tenant assignments without restart.\n";
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        TOLLGATE_LOG_DEBUG(log_component::Config, "Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    // Check for config file path from environment
    if (config_path_.empty()) {
        if (auto env = get_env("TOLLGATE_CONFIG")) {
            config_path_ = *env;
            if (!config_path_.empty()) {
                load_from_file(config_path_);
            }
        }
    }

    // Cache settings
    if (auto env = get_env("TOLLGATE_CACHE_MAX_ENTRIES")) {
        config_.cache.max_entries = parse_int("TOLLGATE_CACHE_MAX_ENTRIES", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_CACHE_MAX_ENTRIES={}", config_.cache.max_entries);
    }

    if (auto env = get_env("TOLLGATE_CACHE_MAX_BYTES")) {
        config_.cache.max_bytes = parse_int("TOLLGATE_CACHE_MAX_BYTES", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_CACHE_MAX_BYTES={}", config_.cache.max_bytes);
    }

    if (auto env = get_env("TOLLGATE_CACHE_TTL")) {
        config_.cache.default_ttl_seconds = parse_int("TOLLGATE_CACHE_TTL", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_CACHE_TTL={}", config_.cache.default_ttl_seconds);
    }

    // Prune settings
    if (auto env = get_env("TOLLGATE_PRUNE_ENABLED")) {
        config_.prune.enabled = parse_bool("TOLLGATE_PRUNE_ENABLED", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_PRUNE_ENABLED={}", config_.prune.enabled);
    }

    if (auto env = get_env("TOLLGATE_PRUNE_INTERVAL")) {
        config_.prune.interval_seconds = parse_int("TOLLGATE_PRUNE_INTERVAL", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_PRUNE_INTERVAL={}", config_.prune.interval_seconds);
    }

    if (auto env = get_env("TOLLGATE_PRUNE_MAX_JOB_AGE_DAYS")) {
        config_.prune.max_job_age_days = parse_int("TOLLGATE_PRUNE_MAX_JOB_AGE_DAYS", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_PRUNE_MAX_JOB_AGE_DAYS={}", config_.prune.max_job_age_days);
    }

    if (auto env = get_env("TOLLGATE_PRUNE_MAX_ARTIFACT_AGE_DAYS")) {
        config_.prune.max_artifact_age_days = parse_int("TOLLGATE_PRUNE_MAX_ARTIFACT_AGE_DAYS", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_PRUNE_MAX_ARTIFACT_AGE_DAYS={}",
                           config_.prune.max_artifact_age_days);
    }

    if (auto env = get_env("TOLLGATE_PRUNE_MAX_ARTIFACTS_PER_TENANT")) {
        config_.prune.max_artifacts_per_tenant = parse_int("TOLLGATE_PRUNE_MAX_ARTIFACTS_PER_TENANT", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_PRUNE_MAX_ARTIFACTS_PER_TENANT={}",
                           config_.prune.max_artifacts_per_tenant);
    }

    if (auto env = get_env("TOLLGATE_PRUNE_BATCH_SIZE")) {
        config_.prune.batch_size = parse_int("TOLLGATE_PRUNE_BATCH_SIZE", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_PRUNE_BATCH_SIZE={}", config_.prune.batch_size);
    }

    if (auto env = get_env("TOLLGATE_PRUNE_DRY_RUN")) {
        config_.prune.dry_run = parse_bool("TOLLGATE_PRUNE_DRY_RUN", *env);
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_PRUNE_DRY_RUN={}", config_.prune.dry_run);
    }

    // Registry settings; a root implies the filesystem provider
    if (auto env = get_env("TOLLGATE_REGISTRY_ROOT")) {
        config_.registry.kind = "filesystem";
        config_.registry.root = *env;
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_REGISTRY_ROOT={}", config_.registry.root);
    }

    // Logging settings
    if (auto env = get_env("TOLLGATE_LOG_LEVEL")) {
        config_.logging.level = *env;
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("TOLLGATE_LOG_FILE")) {
        config_.logging.file = *env;
        TOLLGATE_LOG_DEBUG(log_component::Config, "Applied TOLLGATE_LOG_FILE={}", config_.logging.file);
    }
}

void ConfigManager::apply_cli_overrides(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        // Skip already processed args
        if (arg == "--help" || arg == "-h") continue;
        if (arg == "--config" || arg == "-c") { ++i; continue; }
        if (arg.starts_with("--config=") || arg.starts_with("-c=")) continue;

        if (arg == "--dry-run") {
            cli_dry_run_ = true;
        } else if (arg == "--once") {
            run_once_ = true;
        } else if (arg == "--registry-root" && i + 1 < argc) {
            cli_registry_root_ = argv[++i];
        } else if (arg.starts_with("--registry-root=")) {
            cli_registry_root_ = arg.substr(16);
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli_log_level_ = argv[++i];
        } else if (arg.starts_with("--log-level=")) {
            cli_log_level_ = arg.substr(12);
        } else {
            throw std::runtime_error("Unknown or incomplete option: " + arg);
        }
    }

    reapply_cli_overrides();
}

void ConfigManager::reapply_cli_overrides() {
    if (cli_dry_run_) {
        config_.prune.dry_run = *cli_dry_run_;
    }
    if (cli_registry_root_) {
        config_.registry.kind = "filesystem";
        config_.registry.root = *cli_registry_root_;
    }
    if (cli_log_level_) {
        config_.logging.level = *cli_log_level_;
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace tollgate::config
