/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Retention Scheduler - Implementation
 */

#include "retention/retention_scheduler.hpp"

#include "cache/cache_key.hpp"
#include "util/logger.hpp"

#include <fmt/chrono.h>

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace tollgate::retention {

using util::log_component::Retention;

namespace {

std::string format_time(SystemClock::time_point time) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(time));
}

double to_mb(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace

void PruneConfig::validate() const {
    if (interval.count() <= 0) {
        throw std::invalid_argument("prune.interval must be positive");
    }
    if (batch_size == 0) {
        throw std::invalid_argument("prune.batch_size must be positive");
    }
    if (max_job_age.count() < 0 || max_artifact_age.count() < 0) {
        throw std::invalid_argument("prune ages must not be negative");
    }
}

nlohmann::json PruneStats::to_json() const {
    return nlohmann::json{
        {"timestamp", format_time(timestamp)},
        {"dry_run", dry_run},
        {"interrupted", interrupted},
        {"jobs_deleted", jobs_deleted},
        {"artifacts_deleted", artifacts_deleted},
        {"bytes_freed", bytes_freed},
        {"bytes_freed_mb", to_mb(bytes_freed)},
        {"jobs_candidates", jobs_candidates},
        {"artifacts_candidates", artifacts_candidates},
        {"bytes_candidates", bytes_candidates},
        {"duration_seconds", static_cast<double>(duration.count()) / 1000.0},
        {"errors", errors}
    };
}

RetentionScheduler::RetentionScheduler(asio::io_context& io_context,
                                       PruneConfig config,
                                       std::shared_ptr<Registry> registry,
                                       std::shared_ptr<quota::QuotaLedger> ledger,
                                       std::shared_ptr<cache::CacheStore> cache,
                                       std::shared_ptr<util::Metrics> metrics)
    : timer_(io_context)
    , config_(std::move(config))
    , registry_(std::move(registry))
    , ledger_(std::move(ledger))
    , cache_(std::move(cache))
    , metrics_(std::move(metrics))
{
    if (!registry_ || !ledger_ || !cache_ || !metrics_) {
        throw std::invalid_argument("RetentionScheduler requires registry, ledger, cache and metrics");
    }

    TOLLGATE_LOG_DEBUG(Retention, "RetentionScheduler created: registry={}, interval={}s, "
                       "max_job_age={}h, max_artifact_age={}h, max_artifacts_per_tenant={}, "
                       "batch_size={}, dry_run={}",
                       registry_->kind(), config_.interval.count(),
                       config_.max_job_age.count(), config_.max_artifact_age.count(),
                       config_.max_artifacts_per_tenant, config_.batch_size, config_.dry_run);
}

RetentionScheduler::~RetentionScheduler() {
    stop();
}

void RetentionScheduler::start() {
    config_.validate();

    if (!config_.enabled) {
        TOLLGATE_LOG_INFO(Retention, "Pruning disabled, scheduler not started");
        return;
    }
    if (state_ == SchedulerState::stopped) {
        throw std::logic_error("RetentionScheduler cannot be restarted after stop()");
    }
    if (timer_running_.exchange(true)) {
        return;  // Already running
    }

    TOLLGATE_LOG_INFO(Retention, "RetentionScheduler started (interval={}s{})",
                      config_.interval.count(), config_.dry_run ? ", dry run" : "");
    schedule_tick();
}

void RetentionScheduler::stop() {
    if (state_.exchange(SchedulerState::stopped) == SchedulerState::stopped) {
        return;  // Already stopped
    }

    stop_requested_ = true;
    timer_running_ = false;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_.cancel();
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool finished = cycle_done_.wait_for(lock, config_.shutdown_grace,
                                         [this] { return !cycle_active_.load(); });
    if (!finished) {
        TOLLGATE_LOG_WARN(Retention, "Prune cycle still running after {}s grace period",
                          config_.shutdown_grace.count());
    }
    TOLLGATE_LOG_INFO(Retention, "RetentionScheduler stopped");
}

void RetentionScheduler::schedule_tick() {
    if (!timer_running_) {
        return;
    }

    std::lock_guard<std::mutex> lock(timer_mutex_);
    timer_.expires_after(config_.interval);
    timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                TOLLGATE_LOG_WARN(Retention, "Prune timer error: {}", ec.message());
            }
            return;
        }
        if (!self->timer_running_) {
            return;
        }

        // Arm the next tick first so a tick landing during a long cycle is seen and skipped
        self->schedule_tick();

        if (!self->begin_cycle()) {
            if (self->state() != SchedulerState::stopped) {
                self->metrics_->prune_tick_skipped();
                TOLLGATE_LOG_INFO(Retention, "Prune tick skipped, previous cycle still running");
            }
            return;
        }

        // The worker is joined before the scheduler's other members are destroyed
        asio::post(self->worker_, [scheduler = self.get()] { scheduler->execute_cycle(); });
    });
}

std::optional<PruneStats> RetentionScheduler::run_cycle() {
    if (!begin_cycle()) {
        return std::nullopt;
    }
    return execute_cycle();
}

bool RetentionScheduler::begin_cycle() {
    if (stop_requested_ || cycle_active_.exchange(true)) {
        return false;
    }

    auto expected = SchedulerState::idle;
    if (!state_.compare_exchange_strong(expected, SchedulerState::running)) {
        std::lock_guard<std::mutex> lock(mutex_);
        cycle_active_ = false;
        cycle_done_.notify_all();
        return false;
    }
    return true;
}

void RetentionScheduler::end_cycle() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto running = SchedulerState::running;
        state_.compare_exchange_strong(running, SchedulerState::idle);
        cycle_active_ = false;
    }
    cycle_done_.notify_all();
}

std::optional<PruneStats> RetentionScheduler::execute_cycle() {
    // Releases the cycle slot on every exit path
    struct CycleGuard {
        RetentionScheduler* scheduler;
        ~CycleGuard() { scheduler->end_cycle(); }
    } guard{this};

    if (stop_requested_) {
        TOLLGATE_LOG_DEBUG(Retention, "Prune cycle dropped, shutdown requested before it started");
        return std::nullopt;
    }

    auto start_time = std::chrono::steady_clock::now();
    PruneStats stats;
    stats.timestamp = SystemClock::now();
    stats.dry_run = config_.dry_run;

    TOLLGATE_LOG_INFO(Retention, "Prune cycle started{}", config_.dry_run ? " (dry run)" : "");

    try {
        auto targets = collect_targets(stats.timestamp, stats);

        if (config_.dry_run) {
            for (const auto& target : targets) {
                TOLLGATE_LOG_INFO(Retention, "Dry run: would delete {} {} (tenant={}, {} bytes)",
                                  target.kind == Target::Kind::job ? "job" : "artifact",
                                  target.id, target.tenant_id, target.size_bytes);
            }
        } else {
            auto purged = cache_->purge_expired();
            if (purged > 0) {
                TOLLGATE_LOG_DEBUG(Retention, "Purged {} expired cache entries", purged);
            }

            for (std::size_t offset = 0; offset < targets.size(); offset += config_.batch_size) {
                if (stop_requested_) {
                    stats.interrupted = true;
                    TOLLGATE_LOG_INFO(Retention, "Prune cycle interrupted by shutdown, {} of {} targets processed",
                                      offset, targets.size());
                    break;
                }

                auto end = std::min(offset + config_.batch_size, targets.size());
                for (auto i = offset; i < end; ++i) {
                    delete_target(targets[i], stats);
                }
                TOLLGATE_LOG_DEBUG(Retention, "Prune batch done: {}/{} targets", end, targets.size());
            }
        }
    } catch (const std::exception& e) {
        TOLLGATE_LOG_ERROR(Retention, "Prune cycle aborted: {}", e.what());
        stats.errors.push_back(fmt::format("cycle aborted: {}", e.what()));
    } catch (...) {
        TOLLGATE_LOG_ERROR(Retention, "Prune cycle aborted: unknown error");
        stats.errors.emplace_back("cycle aborted: unknown error");
    }

    stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    TOLLGATE_LOG_INFO(Retention, "Prune cycle finished in {}ms: jobs_deleted={}, artifacts_deleted={}, "
                      "bytes_freed={}, candidates={}/{}, errors={}",
                      stats.duration.count(), stats.jobs_deleted, stats.artifacts_deleted,
                      stats.bytes_freed, stats.jobs_candidates, stats.artifacts_candidates,
                      stats.errors.size());

    util::Logger::instance().event(util::EventLogEntry{
        .kind = util::EventKind::prune_cycle,
        .tenant_id = {},
        .subject = format_time(stats.timestamp),
        .amount = static_cast<std::int64_t>(stats.bytes_freed),
        .detail = fmt::format("jobs_deleted={} artifacts_deleted={} errors={} dry_run={}",
                              stats.jobs_deleted, stats.artifacts_deleted,
                              stats.errors.size(), stats.dry_run)
    });
    metrics_->prune_cycle_completed(stats.jobs_deleted, stats.artifacts_deleted,
                                    stats.bytes_freed, stats.errors.size());

    record(stats);
    return stats;
}

std::vector<RetentionScheduler::Target>
RetentionScheduler::collect_targets(SystemClock::time_point now, PruneStats& stats) const {
    std::vector<Target> targets;
    std::set<std::string> covered;  // Artifacts already removed by an earlier target

    // Artifact sizes, needed for candidate bytes of cascaded job deletions
    std::map<std::string, std::vector<ArtifactRecord>> by_tenant;
    std::map<std::string, const ArtifactRecord*> by_id;
    for (const auto& tenant : registry_->tenants()) {
        by_tenant[tenant] = registry_->artifacts_for_tenant(tenant);
    }
    for (const auto& [tenant, artifacts] : by_tenant) {
        for (const auto& artifact : artifacts) {
            by_id[artifact.artifact_id] = &artifact;
        }
    }

    if (config_.max_job_age.count() > 0) {
        for (const auto& job : registry_->jobs_created_before(now - config_.max_job_age)) {
            targets.push_back(Target{Target::Kind::job, job.job_id, job.tenant_id, 0});
            ++stats.jobs_candidates;

            for (const auto& artifact_id : job.artifact_ids) {
                if (!covered.insert(artifact_id).second) {
                    continue;
                }
                ++stats.artifacts_candidates;
                auto it = by_id.find(artifact_id);
                if (it != by_id.end()) {
                    stats.bytes_candidates += it->second->size_bytes;
                }
            }
        }
    }

    if (config_.max_artifact_age.count() > 0) {
        for (const auto& artifact : registry_->artifacts_created_before(now - config_.max_artifact_age)) {
            if (!covered.insert(artifact.artifact_id).second) {
                continue;
            }
            targets.push_back(Target{Target::Kind::artifact, artifact.artifact_id,
                                     artifact.tenant_id, artifact.size_bytes});
            ++stats.artifacts_candidates;
            stats.bytes_candidates += artifact.size_bytes;
        }
    }

    if (config_.max_artifacts_per_tenant > 0) {
        for (const auto& [tenant, artifacts] : by_tenant) {
            std::vector<const ArtifactRecord*> remaining;
            for (const auto& artifact : artifacts) {
                if (!covered.contains(artifact.artifact_id)) {
                    remaining.push_back(&artifact);
                }
            }
            if (remaining.size() <= config_.max_artifacts_per_tenant) {
                continue;
            }

            // Oldest first beyond the cap
            auto excess = remaining.size() - config_.max_artifacts_per_tenant;
            TOLLGATE_LOG_DEBUG(Retention, "Tenant {} holds {} artifacts, {} over the cap",
                               tenant, remaining.size(), excess);
            for (std::size_t i = 0; i < excess; ++i) {
                const auto& artifact = *remaining[i];
                covered.insert(artifact.artifact_id);
                targets.push_back(Target{Target::Kind::artifact, artifact.artifact_id,
                                         artifact.tenant_id, artifact.size_bytes});
                ++stats.artifacts_candidates;
                stats.bytes_candidates += artifact.size_bytes;
            }
        }
    }

    return targets;
}

void RetentionScheduler::delete_target(const Target& target, PruneStats& stats) {
    try {
        if (target.kind == Target::Kind::job) {
            auto removed = registry_->delete_job(target.id);
            if (!removed) {
                TOLLGATE_LOG_DEBUG(Retention, "Job {} already gone", target.id);
                return;
            }

            ++stats.jobs_deleted;
            ledger_->release(target.tenant_id, quota::Resource::jobs, 1);
            for (const auto& artifact : *removed) {
                artifact_deleted(artifact, stats);
            }
            TOLLGATE_LOG_DEBUG(Retention, "Deleted job {} with {} artifacts", target.id, removed->size());
        } else {
            auto removed = registry_->delete_artifact(target.id);
            if (!removed) {
                TOLLGATE_LOG_DEBUG(Retention, "Artifact {} already gone", target.id);
                return;
            }
            artifact_deleted(*removed, stats);
        }
    } catch (const RegistryError& e) {
        TOLLGATE_LOG_WARN(Retention, "Deletion failed: {}", e.what());
        stats.errors.emplace_back(e.what());
    }
}

void RetentionScheduler::artifact_deleted(const ArtifactRecord& artifact, PruneStats& stats) {
    ++stats.artifacts_deleted;
    stats.bytes_freed += artifact.size_bytes;

    ledger_->release(artifact.tenant_id, quota::Resource::artifacts, artifact.size_bytes);
    auto dropped = cache_->invalidate_prefix(cache::artifact_prefix(artifact.artifact_id));

    TOLLGATE_LOG_DEBUG(Retention, "Deleted artifact {} (tenant={}, {} bytes, {} cache entries dropped)",
                       artifact.artifact_id, artifact.tenant_id, artifact.size_bytes, dropped);
}

void RetentionScheduler::record(PruneStats stats) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.history_size > 0) {
        history_.push_back(stats);
        while (history_.size() > config_.history_size) {
            history_.pop_front();
        }
    }
    last_stats_ = std::move(stats);
}

std::optional<PruneStats> RetentionScheduler::last_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_stats_;
}

std::vector<PruneStats> RetentionScheduler::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

nlohmann::json RetentionScheduler::status() const {
    nlohmann::json status{
        {"enabled", config_.enabled},
        {"state", to_string(state())},
        {"registry", std::string(registry_->kind())},
        {"interval_seconds", config_.interval.count()},
        {"dry_run", config_.dry_run},
        {"max_job_age_days", config_.max_job_age.count() / 24},
        {"max_artifact_age_days", config_.max_artifact_age.count() / 24},
        {"max_artifacts_per_tenant", config_.max_artifacts_per_tenant},
        {"batch_size", config_.batch_size}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    if (last_stats_) {
        status["last_run"] = format_time(last_stats_->timestamp);
        status["last_stats"] = last_stats_->to_json();
    } else {
        status["last_run"] = nullptr;
        status["last_stats"] = nullptr;
    }

    auto history = nlohmann::json::array();
    for (const auto& stats : history_) {
        history.push_back(stats.to_json());
    }
    status["history"] = std::move(history);
    return status;
}

} // namespace tollgate::retention
