#include <catch2/catch_test_macros.hpp>
#include "retention/registry.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

using namespace tollgate::retention;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

constexpr std::chrono::hours kDay{24};

ArtifactRecord artifact(const std::string& id, const std::string& tenant, const std::string& job,
                        SystemClock::time_point created, std::uint64_t size) {
    ArtifactRecord a;
    a.artifact_id = id;
    a.tenant_id = tenant;
    a.job_id = job;
    a.created_at = created;
    a.size_bytes = size;
    return a;
}

JobRecord job(const std::string& id, const std::string& tenant, SystemClock::time_point created) {
    JobRecord j;
    j.job_id = id;
    j.tenant_id = tenant;
    j.created_at = created;
    j.status = "completed";
    return j;
}

// Scratch registry root removed on scope exit
struct TempRoot {
    fs::path path;

    TempRoot() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("tollgate_registry_" + std::to_string(rd()));
        fs::create_directories(path);
    }

    ~TempRoot() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path write(const std::string& relative, std::size_t bytes) const {
        auto file = path / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << std::string(bytes, 'x');
        return file;
    }

    void age(const std::string& relative, std::chrono::hours by) const {
        fs::last_write_time(path / relative, fs::file_time_type::clock::now() - by);
    }
};

} // namespace

// ── InMemoryRegistry ─────────────────────────────────────────────

TEST_CASE("InMemoryRegistry: queries are strict and oldest first", "[registry]") {
    InMemoryRegistry registry;
    auto now = SystemClock::now();
    registry.add_artifact(artifact("b", "acme", "", now - 5 * kDay, 10));
    registry.add_artifact(artifact("a", "acme", "", now - 5 * kDay, 10));
    registry.add_artifact(artifact("c", "acme", "", now - 9 * kDay, 10));
    registry.add_artifact(artifact("d", "acme", "", now, 10));

    auto old = registry.artifacts_created_before(now);
    REQUIRE(old.size() == 3);
    REQUIRE(old[0].artifact_id == "c");
    REQUIRE(old[1].artifact_id == "a");
    REQUIRE(old[2].artifact_id == "b");
}

TEST_CASE("InMemoryRegistry: add_artifact links to its job", "[registry]") {
    InMemoryRegistry registry;
    auto now = SystemClock::now();
    registry.add_job(job("j1", "acme", now));
    registry.add_artifact(artifact("a1", "acme", "j1", now, 100));
    registry.add_artifact(artifact("a2", "acme", "j1", now, 200));

    auto jobs = registry.jobs_created_before(now + 1s);
    REQUIRE(jobs.size() == 1);
    REQUIRE(jobs[0].artifact_ids == std::vector<std::string>{"a1", "a2"});
}

TEST_CASE("InMemoryRegistry: delete_job cascades to its artifacts", "[registry]") {
    InMemoryRegistry registry;
    auto now = SystemClock::now();
    registry.add_job(job("j1", "acme", now));
    registry.add_artifact(artifact("a1", "acme", "j1", now, 100));
    registry.add_artifact(artifact("a2", "acme", "j1", now, 200));
    registry.add_artifact(artifact("loose", "acme", "", now, 50));

    auto removed = registry.delete_job("j1");
    REQUIRE(removed.has_value());
    REQUIRE(removed->size() == 2);
    REQUIRE_FALSE(registry.has_job("j1"));
    REQUIRE(registry.artifact_count() == 1);
    REQUIRE(registry.has_artifact("loose"));
}

TEST_CASE("InMemoryRegistry: deleting twice reports already gone", "[registry]") {
    InMemoryRegistry registry;
    auto now = SystemClock::now();
    registry.add_job(job("j1", "acme", now));
    registry.add_artifact(artifact("a1", "acme", "", now, 100));

    REQUIRE(registry.delete_job("j1").has_value());
    REQUIRE_FALSE(registry.delete_job("j1").has_value());
    REQUIRE(registry.delete_artifact("a1").has_value());
    REQUIRE_FALSE(registry.delete_artifact("a1").has_value());
}

TEST_CASE("InMemoryRegistry: delete_artifact unlinks it from its job", "[registry]") {
    InMemoryRegistry registry;
    auto now = SystemClock::now();
    registry.add_job(job("j1", "acme", now));
    registry.add_artifact(artifact("a1", "acme", "j1", now, 100));

    auto removed = registry.delete_artifact("a1");
    REQUIRE(removed.has_value());
    REQUIRE(removed->size_bytes == 100);
    REQUIRE(registry.jobs_created_before(now + 1s)[0].artifact_ids.empty());
}

TEST_CASE("InMemoryRegistry: failing ids throw RegistryError", "[registry]") {
    InMemoryRegistry registry;
    auto now = SystemClock::now();
    registry.add_artifact(artifact("a1", "acme", "", now, 100));
    registry.fail_deletion("a1");

    REQUIRE_THROWS_AS(registry.delete_artifact("a1"), RegistryError);
    REQUIRE(registry.has_artifact("a1"));
}

TEST_CASE("InMemoryRegistry: tenants and per-tenant artifacts", "[registry]") {
    InMemoryRegistry registry;
    auto now = SystemClock::now();
    registry.add_artifact(artifact("a1", "acme", "", now - kDay, 1));
    registry.add_artifact(artifact("a2", "bigco", "", now, 1));
    registry.add_artifact(artifact("a3", "acme", "", now - 2 * kDay, 1));

    REQUIRE(registry.tenants() == std::vector<std::string>{"acme", "bigco"});
    auto acme = registry.artifacts_for_tenant("acme");
    REQUIRE(acme.size() == 2);
    REQUIRE(acme[0].artifact_id == "a3");
}

// ── FilesystemRegistry ───────────────────────────────────────────

TEST_CASE("FilesystemRegistry: jobs and artifacts come from the directory layout", "[registry][filesystem]") {
    TempRoot root;
    root.write("acme/job1/out.parquet", 100);
    root.write("acme/job1/logs/run.log", 20);
    root.write("acme/report.csv", 5);
    root.write("bigco/job7/out.parquet", 300);

    FilesystemRegistry registry(root.path);
    auto now = SystemClock::now() + 1min;

    auto jobs = registry.jobs_created_before(now);
    REQUIRE(jobs.size() == 2);

    auto acme = registry.artifacts_for_tenant("acme");
    REQUIRE(acme.size() == 3);
    for (const auto& a : acme) {
        REQUIRE(a.tenant_id == "acme");
        if (a.artifact_id == "acme/report.csv") {
            REQUIRE(a.job_id.empty());
            REQUIRE(a.size_bytes == 5);
        } else {
            REQUIRE(a.job_id == "acme/job1");
        }
    }
    REQUIRE(registry.tenants() == std::vector<std::string>{"acme", "bigco"});
}

TEST_CASE("FilesystemRegistry: ages come from modification times", "[registry][filesystem]") {
    TempRoot root;
    root.write("acme/job1/old.bin", 10);
    root.write("acme/job1/new.bin", 10);
    root.age("acme/job1/old.bin", 40 * kDay);
    root.age("acme/job1", 100 * kDay);

    FilesystemRegistry registry(root.path);
    auto cutoff = SystemClock::now() - 30 * kDay;

    auto artifacts = registry.artifacts_created_before(cutoff);
    REQUIRE(artifacts.size() == 1);
    REQUIRE(artifacts[0].artifact_id == "acme/job1/old.bin");

    auto jobs = registry.jobs_created_before(cutoff);
    REQUIRE(jobs.size() == 1);
    REQUIRE(jobs[0].job_id == "acme/job1");
    REQUIRE(jobs[0].artifact_ids.size() == 2);
}

TEST_CASE("FilesystemRegistry: delete_job removes the directory", "[registry][filesystem]") {
    TempRoot root;
    root.write("acme/job1/a.bin", 10);
    root.write("acme/job1/b.bin", 15);

    FilesystemRegistry registry(root.path);
    auto removed = registry.delete_job("acme/job1");
    REQUIRE(removed.has_value());
    REQUIRE(removed->size() == 2);
    REQUIRE_FALSE(fs::exists(root.path / "acme/job1"));
    REQUIRE_FALSE(registry.delete_job("acme/job1").has_value());
}

TEST_CASE("FilesystemRegistry: delete_artifact removes one file", "[registry][filesystem]") {
    TempRoot root;
    root.write("acme/job1/a.bin", 10);
    root.write("acme/job1/b.bin", 15);

    FilesystemRegistry registry(root.path);
    auto removed = registry.delete_artifact("acme/job1/a.bin");
    REQUIRE(removed.has_value());
    REQUIRE(removed->size_bytes == 10);
    REQUIRE(removed->tenant_id == "acme");
    REQUIRE(removed->job_id == "acme/job1");
    REQUIRE(fs::exists(root.path / "acme/job1/b.bin"));
    REQUIRE_FALSE(registry.delete_artifact("acme/job1/a.bin").has_value());
}

TEST_CASE("FilesystemRegistry: ids escaping the root are rejected", "[registry][filesystem]") {
    TempRoot root;
    FilesystemRegistry registry(root.path);
    REQUIRE_THROWS_AS(registry.delete_artifact("../etc/passwd"), RegistryError);
    REQUIRE_THROWS_AS(registry.delete_job("acme/../.."), RegistryError);
}

TEST_CASE("FilesystemRegistry: root must be a directory", "[registry][filesystem]") {
    TempRoot root;
    REQUIRE_THROWS_AS(FilesystemRegistry(root.path / "missing"), std::invalid_argument);
}

// ── make_registry ────────────────────────────────────────────────

TEST_CASE("make_registry: selects the configured provider", "[registry]") {
    TempRoot root;
    REQUIRE(make_registry(RegistryConfig{"memory", ""})->kind() == "memory");
    REQUIRE(make_registry(RegistryConfig{"filesystem", root.path.string()})->kind() == "filesystem");
    REQUIRE_THROWS_AS(make_registry(RegistryConfig{"filesystem", ""}), std::invalid_argument);
    REQUIRE_THROWS_AS(make_registry(RegistryConfig{"s3", ""}), std::invalid_argument);
}
