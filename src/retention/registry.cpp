/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Job/Artifact Registry Implementation
 */

#include "retention/registry.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <set>
#include <system_error>

namespace tollgate::retention {

namespace fs = std::filesystem;
namespace log_component = util::log_component;

namespace {

bool older_first(const ArtifactRecord& a, const ArtifactRecord& b) {
    if (a.created_at != b.created_at) {
        return a.created_at < b.created_at;
    }
    return a.artifact_id < b.artifact_id;
}

} // namespace

// InMemoryRegistry

void InMemoryRegistry::add_job(JobRecord job) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = job.job_id;
    jobs_[id] = std::move(job);
}

void InMemoryRegistry::add_artifact(ArtifactRecord artifact) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!artifact.job_id.empty()) {
        auto job = jobs_.find(artifact.job_id);
        if (job != jobs_.end()) {
            auto& ids = job->second.artifact_ids;
            if (std::find(ids.begin(), ids.end(), artifact.artifact_id) == ids.end()) {
                ids.push_back(artifact.artifact_id);
            }
        }
    }

    auto id = artifact.artifact_id;
    artifacts_[id] = std::move(artifact);
}

void InMemoryRegistry::fail_deletion(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ids_.push_back(id);
}

std::size_t InMemoryRegistry::job_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

std::size_t InMemoryRegistry::artifact_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return artifacts_.size();
}

bool InMemoryRegistry::has_job(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.contains(job_id);
}

bool InMemoryRegistry::has_artifact(const std::string& artifact_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return artifacts_.contains(artifact_id);
}

std::vector<JobRecord> InMemoryRegistry::jobs_created_before(SystemClock::time_point cutoff) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JobRecord> result;
    for (const auto& [id, job] : jobs_) {
        if (job.created_at < cutoff) {
            result.push_back(job);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const JobRecord& a, const JobRecord& b) {
        return a.created_at < b.created_at;
    });
    return result;
}

std::vector<ArtifactRecord> InMemoryRegistry::artifacts_created_before(SystemClock::time_point cutoff) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ArtifactRecord> result;
    for (const auto& [id, artifact] : artifacts_) {
        if (artifact.created_at < cutoff) {
            result.push_back(artifact);
        }
    }
    std::sort(result.begin(), result.end(), older_first);
    return result;
}

std::vector<std::string> InMemoryRegistry::tenants() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> tenants;
    for (const auto& [id, artifact] : artifacts_) {
        tenants.insert(artifact.tenant_id);
    }
    return {tenants.begin(), tenants.end()};
}

std::vector<ArtifactRecord> InMemoryRegistry::artifacts_for_tenant(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ArtifactRecord> result;
    for (const auto& [id, artifact] : artifacts_) {
        if (artifact.tenant_id == tenant_id) {
            result.push_back(artifact);
        }
    }
    std::sort(result.begin(), result.end(), older_first);
    return result;
}

std::optional<std::vector<ArtifactRecord>> InMemoryRegistry::delete_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (std::find(failing_ids_.begin(), failing_ids_.end(), job_id) != failing_ids_.end()) {
        throw RegistryError("Failed to delete job " + job_id + ": storage unavailable");
    }

    auto job = jobs_.find(job_id);
    if (job == jobs_.end()) {
        return std::nullopt;
    }

    std::vector<ArtifactRecord> removed;
    for (auto it = artifacts_.begin(); it != artifacts_.end();) {
        const auto& ids = job->second.artifact_ids;
        bool owned = it->second.job_id == job_id ||
                     std::find(ids.begin(), ids.end(), it->first) != ids.end();
        if (owned) {
            removed.push_back(std::move(it->second));
            it = artifacts_.erase(it);
        } else {
            ++it;
        }
    }

    jobs_.erase(job);
    return removed;
}

std::optional<ArtifactRecord> InMemoryRegistry::delete_artifact(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (std::find(failing_ids_.begin(), failing_ids_.end(), artifact_id) != failing_ids_.end()) {
        throw RegistryError("Failed to delete artifact " + artifact_id + ": storage unavailable");
    }

    auto it = artifacts_.find(artifact_id);
    if (it == artifacts_.end()) {
        return std::nullopt;
    }

    ArtifactRecord record = std::move(it->second);
    artifacts_.erase(it);

    if (!record.job_id.empty()) {
        auto job = jobs_.find(record.job_id);
        if (job != jobs_.end()) {
            auto& ids = job->second.artifact_ids;
            ids.erase(std::remove(ids.begin(), ids.end(), artifact_id), ids.end());
        }
    }
    return record;
}

// FilesystemRegistry

FilesystemRegistry::FilesystemRegistry(fs::path root)
    : root_(fs::weakly_canonical(std::move(root))) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw std::invalid_argument("Registry root is not a directory: " + root_.string());
    }
    TOLLGATE_LOG_DEBUG(log_component::Registry, "Filesystem registry rooted at {}", root_.string());
}

SystemClock::time_point FilesystemRegistry::to_system_time(fs::file_time_type time) {
    return SystemClock::now() + std::chrono::duration_cast<SystemClock::duration>(
        time - fs::file_time_type::clock::now());
}

std::vector<JobRecord> FilesystemRegistry::scan_jobs() const {
    std::vector<JobRecord> jobs;
    std::error_code ec;

    for (const auto& tenant_dir : fs::directory_iterator(root_, ec)) {
        if (!tenant_dir.is_directory(ec)) {
            continue;
        }
        auto tenant_id = tenant_dir.path().filename().string();

        std::error_code job_ec;
        for (const auto& job_dir : fs::directory_iterator(tenant_dir.path(), job_ec)) {
            if (!job_dir.is_directory(job_ec)) {
                continue;
            }

            auto mtime = job_dir.last_write_time(job_ec);
            if (job_ec) {
                TOLLGATE_LOG_WARN(log_component::Registry, "Cannot stat {}: {}", job_dir.path().string(), job_ec.message());
                job_ec.clear();
                continue;
            }

            JobRecord job;
            job.job_id = tenant_id + "/" + job_dir.path().filename().string();
            job.tenant_id = tenant_id;
            job.created_at = to_system_time(mtime);
            job.status = "completed";
            for (const auto& artifact : scan_artifacts(job_dir.path(), tenant_id, job.job_id)) {
                job.artifact_ids.push_back(artifact.artifact_id);
            }
            jobs.push_back(std::move(job));
        }
    }

    if (ec) {
        TOLLGATE_LOG_WARN(log_component::Registry, "Cannot list registry root {}: {}", root_.string(), ec.message());
    }

    std::stable_sort(jobs.begin(), jobs.end(), [](const JobRecord& a, const JobRecord& b) {
        return a.created_at < b.created_at;
    });
    return jobs;
}

std::vector<ArtifactRecord> FilesystemRegistry::scan_artifacts(const fs::path& job_dir,
                                                               const std::string& tenant_id,
                                                               const std::string& job_id) const {
    std::vector<ArtifactRecord> artifacts;
    std::error_code ec;

    for (auto it = fs::recursive_directory_iterator(job_dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }

        auto size = it->file_size(entry_ec);
        auto mtime = it->last_write_time(entry_ec);
        if (entry_ec) {
            continue;
        }

        ArtifactRecord artifact;
        artifact.artifact_id = it->path().lexically_relative(root_).generic_string();
        artifact.tenant_id = tenant_id;
        artifact.job_id = job_id;
        artifact.created_at = to_system_time(mtime);
        artifact.size_bytes = size;
        artifacts.push_back(std::move(artifact));
    }

    return artifacts;
}

std::vector<ArtifactRecord> FilesystemRegistry::scan_all_artifacts() const {
    std::vector<ArtifactRecord> artifacts;
    std::error_code ec;

    for (const auto& tenant_dir : fs::directory_iterator(root_, ec)) {
        if (!tenant_dir.is_directory(ec)) {
            continue;
        }
        auto tenant_id = tenant_dir.path().filename().string();

        std::error_code entry_ec;
        for (const auto& entry : fs::directory_iterator(tenant_dir.path(), entry_ec)) {
            if (entry.is_directory(entry_ec)) {
                auto job_id = tenant_id + "/" + entry.path().filename().string();
                auto owned = scan_artifacts(entry.path(), tenant_id, job_id);
                artifacts.insert(artifacts.end(),
                                 std::make_move_iterator(owned.begin()),
                                 std::make_move_iterator(owned.end()));
            } else if (entry.is_regular_file(entry_ec)) {
                // Loose files under a tenant belong to no job
                auto size = entry.file_size(entry_ec);
                auto mtime = entry.last_write_time(entry_ec);
                if (entry_ec) {
                    entry_ec.clear();
                    continue;
                }
                ArtifactRecord artifact;
                artifact.artifact_id = entry.path().lexically_relative(root_).generic_string();
                artifact.tenant_id = tenant_id;
                artifact.created_at = to_system_time(mtime);
                artifact.size_bytes = size;
                artifacts.push_back(std::move(artifact));
            }
        }
    }

    std::sort(artifacts.begin(), artifacts.end(), older_first);
    return artifacts;
}

std::vector<JobRecord> FilesystemRegistry::jobs_created_before(SystemClock::time_point cutoff) const {
    auto jobs = scan_jobs();
    std::erase_if(jobs, [cutoff](const JobRecord& job) { return job.created_at >= cutoff; });
    return jobs;
}

std::vector<ArtifactRecord> FilesystemRegistry::artifacts_created_before(SystemClock::time_point cutoff) const {
    auto artifacts = scan_all_artifacts();
    std::erase_if(artifacts, [cutoff](const ArtifactRecord& a) { return a.created_at >= cutoff; });
    return artifacts;
}

std::vector<std::string> FilesystemRegistry::tenants() const {
    std::set<std::string> tenants;
    for (const auto& artifact : scan_all_artifacts()) {
        tenants.insert(artifact.tenant_id);
    }
    return {tenants.begin(), tenants.end()};
}

std::vector<ArtifactRecord> FilesystemRegistry::artifacts_for_tenant(const std::string& tenant_id) const {
    auto artifacts = scan_all_artifacts();
    std::erase_if(artifacts, [&tenant_id](const ArtifactRecord& a) { return a.tenant_id != tenant_id; });
    return artifacts;
}

std::optional<std::vector<ArtifactRecord>> FilesystemRegistry::delete_job(const std::string& job_id) {
    auto path = resolve(job_id);

    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return std::nullopt;
    }

    auto slash = job_id.find('/');
    auto tenant_id = slash == std::string::npos ? std::string{} : job_id.substr(0, slash);
    auto removed = scan_artifacts(path, tenant_id, job_id);

    fs::remove_all(path, ec);
    if (ec) {
        throw RegistryError("Failed to delete job " + job_id + ": " + ec.message());
    }
    return removed;
}

std::optional<ArtifactRecord> FilesystemRegistry::delete_artifact(const std::string& artifact_id) {
    auto path = resolve(artifact_id);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    ArtifactRecord record;
    record.artifact_id = artifact_id;
    record.size_bytes = fs::file_size(path, ec);
    auto mtime = fs::last_write_time(path, ec);
    if (!ec) {
        record.created_at = to_system_time(mtime);
    }

    auto rel = path.lexically_relative(root_);
    auto part = rel.begin();
    if (part != rel.end()) {
        record.tenant_id = part->string();
        if (std::distance(rel.begin(), rel.end()) > 2) {
            record.job_id = record.tenant_id + "/" + std::next(part)->string();
        }
    }

    if (!fs::remove(path, ec) || ec) {
        throw RegistryError("Failed to delete artifact " + artifact_id + ": " +
                            (ec ? ec.message() : std::string("file vanished during removal")));
    }
    return record;
}

fs::path FilesystemRegistry::resolve(const std::string& id) const {
    auto path = (root_ / id).lexically_normal();
    auto rel = path.lexically_relative(root_);
    if (id.empty() || rel.empty() || *rel.begin() == ".." || rel == ".") {
        throw RegistryError("Registry id escapes root: " + id);
    }
    return path;
}

std::shared_ptr<Registry> make_registry(const RegistryConfig& config) {
    if (config.kind == "memory") {
        return std::make_shared<InMemoryRegistry>();
    }
    if (config.kind == "filesystem") {
        if (config.root.empty()) {
            throw std::invalid_argument("registry.root is required for the filesystem registry");
        }
        return std::make_shared<FilesystemRegistry>(config.root);
    }
    throw std::invalid_argument("Unknown registry kind: " + config.kind);
}

} // namespace tollgate::retention
