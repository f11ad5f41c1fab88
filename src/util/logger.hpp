/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Logger - Structured logging with spdlog
 *
 * Provides:
 * - Structured logging with levels (DEBUG, INFO, WARN, ERROR)
 * - Log format: timestamp, level, component, message
 * - Event log: one line per governance event (cache hit/miss, eviction,
 *   quota denial, prune cycle) for the external audit/metrics collector
 * - Configurable log level via config/environment
 * - Log rotation support (or stdout for container deployment)
 */

#ifndef TOLLGATE_UTIL_LOGGER_HPP
#define TOLLGATE_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tollgate::util {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Logging configuration
 */
struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for stdout only
    std::size_t max_file_size_mb{100}; // Max size before rotation
    std::size_t max_files{5};          // Number of rotated files to keep
    bool enable_console{true};         // Log to stdout
    bool enable_colors{true};          // Colored console output
};

/**
 * Governance event kinds emitted on the event log
 */
enum class EventKind {
    cache_hit,
    cache_miss,
    cache_eviction,
    quota_denial,
    compute_failure,
    prune_cycle
};

std::string_view to_string(EventKind kind);

/**
 * Event log entry
 */
struct EventLogEntry {
    EventKind kind{EventKind::cache_miss};
    std::string tenant_id;
    std::string subject;        // Cache key, resource name or cycle id
    std::int64_t amount{0};     // Bytes, units or deleted count depending on kind
    std::string detail;
};

/**
 * Logger class - centralized logging with component tagging
 *
 * Thread-safe singleton that manages application-wide logging.
 *
 * Note: Destructor is public to allow std::unique_ptr to clean up the singleton.
 * The singleton pattern is maintained by keeping the constructor private.
 */
class Logger {
public:
    /**
     * Initialize the logger with configuration
     * Must be called before any logging occurs
     */
    static void init(const LogConfig& config);

    /**
     * Get the logger instance (creates default if not initialized)
     */
    static Logger& instance();

    ~Logger();

    /**
     * Set the global log level
     */
    void set_level(LogLevel level);

    LogLevel get_level() const;

    /**
     * Parse log level from string (case-insensitive)
     * Valid values: trace, debug, info, warn, error, critical, off
     */
    static std::optional<LogLevel> parse_level(std::string_view level_str);

    static std::string_view level_to_string(LogLevel level);

    // Component-tagged logging methods
    template<typename... Args>
    void trace(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, component, fmt, std::forward<Args>(args)...);
    }

    /**
     * Log a governance event (dedicated event log format)
     */
    void event(const EventLogEntry& entry);

    /**
     * Shutdown and flush all logs
     */
    void shutdown();

private:
    Logger() = default;

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void configure(const LogConfig& config);

    template<typename... Args>
    void log(LogLevel level, std::string_view component, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_) return;

        // Format message with component prefix
        auto msg = fmt::format(fmt, std::forward<Args>(args)...);
        auto full_msg = fmt::format("[{}] {}", component, msg);

        switch (level) {
            case LogLevel::Trace:    logger_->trace(full_msg); break;
            case LogLevel::Debug:    logger_->debug(full_msg); break;
            case LogLevel::Info:     logger_->info(full_msg); break;
            case LogLevel::Warn:     logger_->warn(full_msg); break;
            case LogLevel::Error:    logger_->error(full_msg); break;
            case LogLevel::Critical: logger_->critical(full_msg); break;
            default: break;
        }
    }

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::logger> event_logger_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    mutable std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

// Convenience macros for logging with automatic component tagging
#define TOLLGATE_LOG_TRACE(component, ...) \
    ::tollgate::util::Logger::instance().trace(component, __VA_ARGS__)
#define TOLLGATE_LOG_DEBUG(component, ...) \
    ::tollgate::util::Logger::instance().debug(component, __VA_ARGS__)
#define TOLLGATE_LOG_INFO(component, ...) \
    ::tollgate::util::Logger::instance().info(component, __VA_ARGS__)
#define TOLLGATE_LOG_WARN(component, ...) \
    ::tollgate::util::Logger::instance().warn(component, __VA_ARGS__)
#define TOLLGATE_LOG_ERROR(component, ...) \
    ::tollgate::util::Logger::instance().error(component, __VA_ARGS__)
#define TOLLGATE_LOG_CRITICAL(component, ...) \
    ::tollgate::util::Logger::instance().critical(component, __VA_ARGS__)

// Component constants
namespace log_component {
    constexpr std::string_view Config = "config";
    constexpr std::string_view Cache = "cache";
    constexpr std::string_view Quota = "quota";
    constexpr std::string_view Retention = "retention";
    constexpr std::string_view Registry = "registry";
    constexpr std::string_view Facade = "facade";
    constexpr std::string_view Service = "service";
}

} // namespace tollgate::util

#endif // TOLLGATE_UTIL_LOGGER_HPP
