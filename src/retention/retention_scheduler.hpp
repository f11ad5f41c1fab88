/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Retention Scheduler - Periodic age and cap based pruning of jobs and artifacts
 *
 * Each cycle deletes, in batches:
 * - jobs older than max_job_age (their artifacts go with them)
 * - artifacts older than max_artifact_age
 * - the oldest artifacts of any tenant holding more than max_artifacts_per_tenant
 *
 * Every deleted artifact releases its bytes on the quota ledger and drops the
 * cache entries keyed to it. Only one cycle runs at a time; a timer tick that
 * arrives while a cycle is running is skipped.
 *
 * The timer lives on the caller's io_context, cycles run on the scheduler's own
 * worker thread, so signal handling and stop() are never queued behind a cycle.
 */

#ifndef TOLLGATE_RETENTION_RETENTION_SCHEDULER_HPP
#define TOLLGATE_RETENTION_RETENTION_SCHEDULER_HPP

#include "cache/cache_store.hpp"
#include "quota/quota_ledger.hpp"
#include "retention/registry.hpp"
#include "util/metrics.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tollgate::retention {

namespace asio = boost::asio;

/**
 * Scheduler lifecycle state
 */
enum class SchedulerState {
    idle,     // Waiting for the next tick
    running,  // Executing a prune cycle
    stopped   // Terminal
};

inline std::string to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::idle: return "idle";
        case SchedulerState::running: return "running";
        case SchedulerState::stopped: return "stopped";
        default: return "unknown";
    }
}

/**
 * Prune configuration, fixed for the lifetime of a scheduler
 */
struct PruneConfig {
    bool enabled{true};
    std::chrono::seconds interval{std::chrono::hours(24)};
    std::chrono::hours max_job_age{24 * 90};                // 90 days, 0 = no age rule
    std::chrono::hours max_artifact_age{24 * 30};           // 30 days, 0 = no age rule
    std::size_t max_artifacts_per_tenant{1000};             // 0 = no cap
    std::size_t batch_size{100};
    bool dry_run{false};
    std::size_t history_size{20};                           // Cycles kept for status()
    std::chrono::seconds shutdown_grace{30};

    /**
     * @throws std::invalid_argument for a non-positive interval or batch size
     */
    void validate() const;
};

/**
 * Report of one prune cycle
 */
struct PruneStats {
    std::uint64_t jobs_deleted{0};
    std::uint64_t artifacts_deleted{0};
    std::uint64_t bytes_freed{0};

    // What the cycle selected; equals the deleted counts unless dry run or failures
    std::uint64_t jobs_candidates{0};
    std::uint64_t artifacts_candidates{0};
    std::uint64_t bytes_candidates{0};

    std::chrono::milliseconds duration{0};
    std::vector<std::string> errors;
    SystemClock::time_point timestamp;
    bool dry_run{false};
    bool interrupted{false};     // Stopped between batches by shutdown

    nlohmann::json to_json() const;
};

/**
 * Retention scheduler
 *
 * Runs its timer on the supplied io_context and posts each cycle to a
 * dedicated worker. run_cycle() may also be called directly (manual prune,
 * --once mode) and obeys the same one-cycle-at-a-time rule.
 */
class RetentionScheduler : public std::enable_shared_from_this<RetentionScheduler> {
public:
    RetentionScheduler(asio::io_context& io_context,
                       PruneConfig config,
                       std::shared_ptr<Registry> registry,
                       std::shared_ptr<quota::QuotaLedger> ledger,
                       std::shared_ptr<cache::CacheStore> cache,
                       std::shared_ptr<util::Metrics> metrics);
    ~RetentionScheduler();

    // Non-copyable
    RetentionScheduler(const RetentionScheduler&) = delete;
    RetentionScheduler& operator=(const RetentionScheduler&) = delete;

    /**
     * Validate the configuration and start the timer (no-op when disabled)
     * @throws std::invalid_argument for an invalid configuration
     */
    void start();

    /**
     * Stop the timer and wait up to shutdown_grace for a running cycle to
     * reach its next batch boundary. The scheduler cannot be restarted.
     */
    void stop();

    /**
     * Run one prune cycle now
     *
     * @return The cycle report, nullopt if a cycle is already running or the
     *         scheduler is stopped
     */
    std::optional<PruneStats> run_cycle();

    SchedulerState state() const noexcept { return state_.load(); }

    /**
     * Most recent cycle report
     */
    std::optional<PruneStats> last_stats() const;

    /**
     * Recent cycle reports, oldest first
     */
    std::vector<PruneStats> history() const;

    /**
     * Enabled flag, state, interval, last run and bounded history
     */
    nlohmann::json status() const;

    const PruneConfig& config() const noexcept { return config_; }

private:
    /**
     * Deletion target within a cycle
     */
    struct Target {
        enum class Kind { job, artifact } kind;
        std::string id;
        std::string tenant_id;
        std::uint64_t size_bytes{0};
    };

    void schedule_tick();

    /**
     * Claim the single cycle slot and move to running
     * @return false if a cycle is active or the scheduler is stopped
     */
    bool begin_cycle();

    /**
     * Run a cycle whose slot was claimed by begin_cycle()
     */
    std::optional<PruneStats> execute_cycle();

    void end_cycle();

    /**
     * Select everything this cycle should remove
     */
    std::vector<Target> collect_targets(SystemClock::time_point now, PruneStats& stats) const;

    /**
     * Delete one target, recording failures in stats
     */
    void delete_target(const Target& target, PruneStats& stats);

    /**
     * Release quota and cache state held by a deleted artifact
     */
    void artifact_deleted(const ArtifactRecord& artifact, PruneStats& stats);

    void record(PruneStats stats);

    asio::steady_timer timer_;
    std::mutex timer_mutex_;
    const PruneConfig config_;

    std::shared_ptr<Registry> registry_;
    std::shared_ptr<quota::QuotaLedger> ledger_;
    std::shared_ptr<cache::CacheStore> cache_;
    std::shared_ptr<util::Metrics> metrics_;

    std::atomic<SchedulerState> state_{SchedulerState::idle};
    std::atomic<bool> cycle_active_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> timer_running_{false};

    mutable std::mutex mutex_;
    std::condition_variable cycle_done_;
    std::deque<PruneStats> history_;
    std::optional<PruneStats> last_stats_;

    // Last member: joined first on destruction, while everything a cycle uses is alive
    asio::thread_pool worker_{1};
};

} // namespace tollgate::retention

#endif // TOLLGATE_RETENTION_RETENTION_SCHEDULER_HPP
