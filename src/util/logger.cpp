/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <cctype>
#include <vector>

namespace tollgate::util {

// Static members
std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

std::string_view to_string(EventKind kind) {
    switch (kind) {
        case EventKind::cache_hit:       return "cache_hit";
        case EventKind::cache_miss:      return "cache_miss";
        case EventKind::cache_eviction:  return "cache_eviction";
        case EventKind::quota_denial:    return "quota_denial";
        case EventKind::compute_failure: return "compute_failure";
        case EventKind::prune_cycle:     return "prune_cycle";
        default:                         return "unknown";
    }
}

void Logger::init(const LogConfig& config) {
    std::call_once(init_flag_, [&config]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->configure(config);
    });
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        LogConfig config;
        config.level = LogLevel::Info;
        config.enable_console = true;
        config.enable_colors = true;
        instance_->configure(config);
    });
    return *instance_;
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (config.enable_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console_sink->set_color_mode(spdlog::color_mode::never);
        }
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    // File sink with rotation
    if (!config.file_path.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("tollgate", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog_level(config.level));
    logger_->flush_on(spdlog::level::warn);

    // Events share the sinks; they follow the main level so tests can silence them
    event_logger_ = std::make_shared<spdlog::logger>("events", sinks.begin(), sinks.end());
    event_logger_->set_level(to_spdlog_level(config.level));
    event_logger_->flush_on(spdlog::level::info);

    current_level_.store(config.level, std::memory_order_relaxed);

    spdlog::drop("tollgate");
    spdlog::drop("events");
    spdlog::register_logger(logger_);
    spdlog::register_logger(event_logger_);
    spdlog::set_default_logger(logger_);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
    if (event_logger_) {
        event_logger_->set_level(to_spdlog_level(level));
    }
    current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return current_level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view level_str) {
    std::string lower;
    lower.reserve(level_str.size());
    for (char c : level_str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "err") return LogLevel::Error;
    if (lower == "critical" || lower == "crit" || lower == "fatal") return LogLevel::Critical;
    if (lower == "off" || lower == "none") return LogLevel::Off;

    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warn:     return "warn";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
        default:                 return "unknown";
    }
}

void Logger::event(const EventLogEntry& entry) {
    if (!event_logger_) return;

    // Format: kind tenant subject amount detail
    // Example: quota_denial acme cache_bytes 4096 "current=1048576 limit=1048576"
    event_logger_->info(
        R"(event={} tenant={} subject={} amount={} "{}")",
        to_string(entry.kind),
        entry.tenant_id.empty() ? "-" : entry.tenant_id,
        entry.subject.empty() ? "-" : entry.subject,
        entry.amount,
        entry.detail
    );
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    if (event_logger_) {
        event_logger_->flush();
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
        default:                 return spdlog::level::info;
    }
}

} // namespace tollgate::util
