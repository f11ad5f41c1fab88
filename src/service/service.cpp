/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Service host implementation
 */

#include "service/service.hpp"

#include "util/logger.hpp"

#include <csignal>

namespace tollgate::service {

namespace log_component = util::log_component;

Service::Service(const ServiceConfig& config)
    : config_(config)
    , io_context_(static_cast<int>(config.thread_count))
    , work_guard_(asio::make_work_guard(io_context_))
    , signals_(io_context_)
{
    TOLLGATE_LOG_DEBUG(log_component::Service, "Initializing with {} threads", config_.thread_count);
}

Service::~Service() {
    stop();
    wait();
}

void Service::start(ReloadHandler reload_handler, ShutdownHandler shutdown_handler) {
    if (running_.exchange(true)) {
        TOLLGATE_LOG_WARN(log_component::Service, "Already running, ignoring start request");
        return;
    }

    reload_handler_ = std::move(reload_handler);
    shutdown_handler_ = std::move(shutdown_handler);

    setup_signal_handling();

    thread_pool_.reserve(config_.thread_count);
    for (std::size_t i = 0; i < config_.thread_count; ++i) {
        thread_pool_.emplace_back([this](std::stop_token st) {
            run_io_context(st);
        });
    }

    TOLLGATE_LOG_INFO(log_component::Service, "Started with {} worker threads", config_.thread_count);
}

void Service::stop() {
    if (!running_.exchange(false)) {
        return; // Already stopped
    }

    TOLLGATE_LOG_INFO(log_component::Service, "Initiating graceful shutdown...");

    // Let components finish their current work while the io_context still runs
    if (shutdown_handler_) {
        try {
            shutdown_handler_();
        } catch (const std::exception& e) {
            TOLLGATE_LOG_ERROR(log_component::Service, "Shutdown handler failed: {}", e.what());
        }
    }

    boost::system::error_code ec;
    signals_.cancel(ec);

    work_guard_.reset();

    for (auto& thread : thread_pool_) {
        thread.request_stop();
    }

    io_context_.stop();

    TOLLGATE_LOG_INFO(log_component::Service, "Shutdown initiated, waiting for threads...");
}

void Service::wait() {
    for (auto& thread : thread_pool_) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        }
    }
    thread_pool_.clear();
    TOLLGATE_LOG_INFO(log_component::Service, "All worker threads terminated");
}

bool Service::is_running() const noexcept {
    return running_.load();
}

asio::io_context& Service::get_io_context() noexcept {
    return io_context_;
}

void Service::run_io_context(std::stop_token stop_token) {
    TOLLGATE_LOG_DEBUG(log_component::Service, "Worker thread started");

    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            break; // Normal exit when io_context runs out of work
        } catch (const std::exception& e) {
            TOLLGATE_LOG_ERROR(log_component::Service, "Exception in worker thread: {}", e.what());
        }
    }

    TOLLGATE_LOG_DEBUG(log_component::Service, "Worker thread exiting");
}

void Service::setup_signal_handling() {
    boost::system::error_code ec;
    signals_.add(SIGINT, ec);
    signals_.add(SIGTERM, ec);
    signals_.add(SIGHUP, ec);
    if (ec) {
        TOLLGATE_LOG_WARN(log_component::Service, "Failed to register signal handlers: {}", ec.message());
    }

    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                TOLLGATE_LOG_DEBUG(log_component::Service, "Signal handler error: {}", ec.message());
            }
            return;
        }

        // SIGHUP triggers a reload, not shutdown
        if (signal_number == SIGHUP) {
            ++reloads_;
            TOLLGATE_LOG_INFO(log_component::Service, "Received SIGHUP (#{}) - reloading configuration", reloads_.load());
            if (reload_handler_) {
                try {
                    reload_handler_();
                } catch (const std::exception& e) {
                    TOLLGATE_LOG_ERROR(log_component::Service, "Configuration reload failed: {}", e.what());
                }
            } else {
                TOLLGATE_LOG_WARN(log_component::Service, "No reload handler configured, ignoring SIGHUP");
            }
            // Re-register for next signal
            setup_signal_handling();
            return;
        }

        TOLLGATE_LOG_INFO(log_component::Service, "Received signal {} - initiating shutdown", signal_number);
        stop();
    });

    TOLLGATE_LOG_DEBUG(log_component::Service, "Signal handlers installed (SIGINT, SIGTERM, SIGHUP)");
}

} // namespace tollgate::service
