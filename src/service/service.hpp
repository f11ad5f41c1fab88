/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Service host - io_context, worker threads and signal handling for the daemon
 */

#ifndef TOLLGATE_SERVICE_SERVICE_HPP
#define TOLLGATE_SERVICE_SERVICE_HPP

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <thread>
#include <vector>

namespace tollgate::service {

namespace asio = boost::asio;

/**
 * Service host configuration
 */
struct ServiceConfig {
    std::size_t thread_count{1};
};

/**
 * Called on SIGHUP
 */
using ReloadHandler = std::function<void()>;

/**
 * Called once when shutdown starts, before the io_context is stopped
 */
using ShutdownHandler = std::function<void()>;

/**
 * Hosts background components (the retention timer) on an io_context
 *
 * Uses std::jthread with stop_token for graceful shutdown.
 * SIGINT/SIGTERM stop the service, SIGHUP invokes the reload handler.
 */
class Service {
public:
    explicit Service(const ServiceConfig& config);
    ~Service();

    // Non-copyable, non-movable (owns threads and io_context)
    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;
    Service(Service&&) = delete;
    Service& operator=(Service&&) = delete;

    /**
     * Install signal handlers and start the worker threads
     */
    void start(ReloadHandler reload_handler = {}, ShutdownHandler shutdown_handler = {});

    /**
     * Request graceful shutdown
     */
    void stop();

    /**
     * Block until all worker threads have exited
     */
    void wait();

    bool is_running() const noexcept;

    /**
     * Get the io_context (for scheduling async work)
     */
    asio::io_context& get_io_context() noexcept;

private:
    void run_io_context(std::stop_token stop_token);
    void setup_signal_handling();

    ServiceConfig config_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    asio::signal_set signals_;

    std::vector<std::jthread> thread_pool_;
    ReloadHandler reload_handler_;
    ShutdownHandler shutdown_handler_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> reloads_{0};
};

} // namespace tollgate::service

#endif // TOLLGATE_SERVICE_SERVICE_HPP
