/**
 * TOLLGATE - Query Result Cache & Retention Governor
 * Job/Artifact Registry - Enumeration and deletion of retained resources
 *
 * The registry is the system of record for jobs and their output artifacts.
 * The retention scheduler is its only deleting caller. Providers:
 * - memory      In-process maps, for development and tests
 * - filesystem  <root>/<tenant>/<job>/<artifact files>, ages from mtime
 */

#ifndef TOLLGATE_RETENTION_REGISTRY_HPP
#define TOLLGATE_RETENTION_REGISTRY_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tollgate::retention {

using SystemClock = std::chrono::system_clock;

/**
 * A job known to the registry
 */
struct JobRecord {
    std::string job_id;
    std::string tenant_id;
    SystemClock::time_point created_at;
    std::string status;
    std::vector<std::string> artifact_ids;
};

/**
 * A job output artifact
 */
struct ArtifactRecord {
    std::string artifact_id;
    std::string tenant_id;
    std::string job_id;            // Empty for artifacts not owned by a job
    SystemClock::time_point created_at;
    std::uint64_t size_bytes{0};
};

/**
 * Raised by a provider when a deletion fails
 */
class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Registry capability shared by all providers
 */
class Registry {
public:
    virtual ~Registry() = default;

    /**
     * Jobs created strictly before cutoff, oldest first
     */
    virtual std::vector<JobRecord> jobs_created_before(SystemClock::time_point cutoff) const = 0;

    /**
     * Artifacts created strictly before cutoff, oldest first
     */
    virtual std::vector<ArtifactRecord> artifacts_created_before(SystemClock::time_point cutoff) const = 0;

    /**
     * Tenants that own at least one artifact
     */
    virtual std::vector<std::string> tenants() const = 0;

    /**
     * A tenant's artifacts, oldest first (ties by id)
     */
    virtual std::vector<ArtifactRecord> artifacts_for_tenant(const std::string& tenant_id) const = 0;

    /**
     * Delete a job and the artifacts it owns
     *
     * @return The artifacts removed along with the job, nullopt if the job was already gone
     * @throws RegistryError on failure
     */
    virtual std::optional<std::vector<ArtifactRecord>> delete_job(const std::string& job_id) = 0;

    /**
     * Delete a single artifact
     *
     * @return The deleted record, nullopt if it was already gone
     * @throws RegistryError on failure
     */
    virtual std::optional<ArtifactRecord> delete_artifact(const std::string& artifact_id) = 0;

    virtual std::string_view kind() const noexcept = 0;
};

/**
 * In-memory registry
 */
class InMemoryRegistry : public Registry {
public:
    InMemoryRegistry() = default;

    /**
     * Add a job; its artifact_ids are linked to artifacts added with the same job_id
     */
    void add_job(JobRecord job);

    /**
     * Add an artifact, linking it to its job when job_id is set
     */
    void add_artifact(ArtifactRecord artifact);

    /**
     * Make deletions of this id throw RegistryError
     */
    void fail_deletion(const std::string& id);

    std::size_t job_count() const;
    std::size_t artifact_count() const;
    bool has_job(const std::string& job_id) const;
    bool has_artifact(const std::string& artifact_id) const;

    std::vector<JobRecord> jobs_created_before(SystemClock::time_point cutoff) const override;
    std::vector<ArtifactRecord> artifacts_created_before(SystemClock::time_point cutoff) const override;
    std::vector<std::string> tenants() const override;
    std::vector<ArtifactRecord> artifacts_for_tenant(const std::string& tenant_id) const override;
    std::optional<std::vector<ArtifactRecord>> delete_job(const std::string& job_id) override;
    std::optional<ArtifactRecord> delete_artifact(const std::string& artifact_id) override;

    std::string_view kind() const noexcept override { return "memory"; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, JobRecord> jobs_;
    std::map<std::string, ArtifactRecord> artifacts_;
    std::vector<std::string> failing_ids_;
};

/**
 * Filesystem registry rooted at a directory
 *
 * Layout: <root>/<tenant>/<job>/<artifact>. A job is a directory, an artifact
 * is a regular file anywhere below a job directory. Artifact ids are the path
 * relative to root ("tenant/job/file"). Creation times are modification times.
 */
class FilesystemRegistry : public Registry {
public:
    explicit FilesystemRegistry(std::filesystem::path root);

    std::vector<JobRecord> jobs_created_before(SystemClock::time_point cutoff) const override;
    std::vector<ArtifactRecord> artifacts_created_before(SystemClock::time_point cutoff) const override;
    std::vector<std::string> tenants() const override;
    std::vector<ArtifactRecord> artifacts_for_tenant(const std::string& tenant_id) const override;
    std::optional<std::vector<ArtifactRecord>> delete_job(const std::string& job_id) override;
    std::optional<ArtifactRecord> delete_artifact(const std::string& artifact_id) override;

    std::string_view kind() const noexcept override { return "filesystem"; }

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::vector<JobRecord> scan_jobs() const;
    std::vector<ArtifactRecord> scan_artifacts(const std::filesystem::path& job_dir,
                                               const std::string& tenant_id,
                                               const std::string& job_id) const;
    std::vector<ArtifactRecord> scan_all_artifacts() const;

    /**
     * Resolve an id below root, rejecting ids that escape it
     */
    std::filesystem::path resolve(const std::string& id) const;

    static SystemClock::time_point to_system_time(std::filesystem::file_time_type time);

    std::filesystem::path root_;
};

/**
 * Registry provider configuration
 */
struct RegistryConfig {
    std::string kind{"memory"};
    std::string root;
};

/**
 * Create the configured provider
 * @throws std::invalid_argument for an unknown kind or a filesystem provider without root
 */
std::shared_ptr<Registry> make_registry(const RegistryConfig& config);

} // namespace tollgate::retention

#endif // TOLLGATE_RETENTION_REGISTRY_HPP
