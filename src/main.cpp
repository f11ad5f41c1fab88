/**
 * TOLLGATE - Query Result Cache & Retention Governor
 *
 * tollgated: hosts the retention scheduler over the configured job/artifact
 * registry, alongside the result cache and quota ledger it keeps consistent.
 */

#include "cache/cache_store.hpp"
#include "config/config.hpp"
#include "facade/cache_facade.hpp"
#include "quota/quota_ledger.hpp"
#include "retention/registry.hpp"
#include "retention/retention_scheduler.hpp"
#include "service/service.hpp"
#include "util/logger.hpp"
#include "util/metrics.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>

using namespace tollgate;
namespace log_component = util::log_component;

namespace {

void apply_quota(quota::QuotaLedger& ledger, const config::QuotaSettings& settings) {
    ledger.set_tiers(settings.to_tier_policies(), settings.default_tier);
    ledger.set_assignments({settings.tenants.begin(), settings.tenants.end()});
    TOLLGATE_LOG_INFO(log_component::Service, "Quota policy applied: {} tiers, {} tenant assignments",
                      settings.tiers.size(), settings.tenants.size());
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Load configuration
        config::ConfigManager config_manager;
        if (!config_manager.load(argc, argv)) {
            // --help was requested
            return 0;
        }

        auto config = config_manager.get_config();
        util::Logger::init(config.logging.to_log_config());

        TOLLGATE_LOG_INFO(log_component::Service, "TOLLGATE Query Result Cache & Retention Governor v0.1.0");

        // Governance layer, shared explicitly by every component
        auto metrics = std::make_shared<util::Metrics>();
        auto store = std::make_shared<cache::CacheStore>(config.cache.to_store_config());
        auto ledger = std::make_shared<quota::QuotaLedger>();
        apply_quota(*ledger, config.quota);
        // Releases the owner's cache_bytes whenever an entry leaves the store
        auto cache_facade = std::make_shared<facade::CacheFacade>(store, ledger, metrics);

        auto registry = retention::make_registry(config.registry.to_registry_config());
        TOLLGATE_LOG_INFO(log_component::Service, "Cache: max_entries={}, max_bytes={}, ttl={}s; registry={}",
                          config.cache.max_entries, config.cache.max_bytes,
                          config.cache.default_ttl_seconds, registry->kind());

        service::ServiceConfig service_config;
        service_config.thread_count = config.service.threads > 0
            ? config.service.threads
            : std::max(1u, std::thread::hardware_concurrency());

        service::Service service(service_config);

        auto scheduler = std::make_shared<retention::RetentionScheduler>(
            service.get_io_context(), config.prune.to_prune_config(),
            registry, ledger, store, metrics);

        // One cycle, report as JSON, exit
        if (config_manager.run_once()) {
            auto stats = scheduler->run_cycle();
            if (!stats) {
                TOLLGATE_LOG_ERROR(log_component::Service, "Prune cycle could not be started");
                return 1;
            }
            std::cout << stats->to_json().dump(2) << std::endl;
            scheduler->stop();
            util::Logger::instance().shutdown();
            return stats->errors.empty() ? 0 : 2;
        }

        // SIGHUP reloads quota tiers and tenant assignments
        config_manager.on_reload([ledger](const config::QuotaSettings& settings) {
            apply_quota(*ledger, settings);
        });

        // Invalid prune settings are fatal here, before any worker runs
        scheduler->start();

        service.start(
            [&config_manager]() {
                config_manager.reload();
            },
            [scheduler, metrics, store, cache_facade]() {
                scheduler->stop();
                TOLLGATE_LOG_INFO(log_component::Service, "Computes still in flight: {}",
                                  cache_facade->in_flight());
                TOLLGATE_LOG_INFO(log_component::Service, "Final status: {}", scheduler->status().dump());
                TOLLGATE_LOG_INFO(log_component::Service, "Final metrics: {}", metrics->snapshot().to_json());
                TOLLGATE_LOG_INFO(log_component::Service, "Cache hit rate: {:.4f}", store->stats().hit_rate());
            }
        );

        TOLLGATE_LOG_INFO(log_component::Service, "Service started successfully");
        TOLLGATE_LOG_INFO(log_component::Service, "Press Ctrl+C to stop");

        // Wait for shutdown (blocks until signal received)
        service.wait();

        TOLLGATE_LOG_INFO(log_component::Service, "Service stopped gracefully");
        util::Logger::instance().shutdown();
        return 0;

    } catch (const std::exception& e) {
        TOLLGATE_LOG_CRITICAL(log_component::Service, "Fatal error: {}", e.what());
        util::Logger::instance().shutdown();
        return 1;
    }
}
