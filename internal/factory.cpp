#include "factory.hpp"

#include <chrono>
#include <string>

#include "internal/config/refinement_config.hpp"
#include "internal/core/refinement_orchestrator.hpp"
#include "internal/db/memory/memory_vulnerability_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_vulnerability_repository.hpp"
#include "internal/grpc/refinement_server.hpp"
#include "internal/ingest/record_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/vuln/http_vulnerability_feed.hpp"
#include "internal/vuln/static_vulnerability_feed.hpp"
#include "internal/vuln/vulnerability_catalog.hpp"
#include "refiner/v1.hpp"

namespace refiner::factory {

using namespace refiner;
using refiner::observability::IntField;
using refiner::observability::StringField;

std::shared_ptr<db::VulnerabilityRepository> BuildVulnerabilityCache(const refiner::runtime::config::RuntimeConfig& config) {
  const auto& vulnerability = config.vulnerability();
  if (vulnerability.has_sqlite_cache() && !vulnerability.sqlite_cache().path().empty()) {
    const auto& sqlite_cache = vulnerability.sqlite_cache();
    const auto  busy_timeout =
        sqlite_cache.has_busy_timeout_ms() ? std::chrono::milliseconds(sqlite_cache.busy_timeout_ms()) : std::chrono::milliseconds(5000);
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite_cache.path(), busy_timeout);
    REFINER_LOG_INFO("vulnerability cache", {StringField("backend", "sqlite"), StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteVulnerabilityRepository>(std::move(sqlite_db));
  }

  REFINER_LOG_INFO("vulnerability cache", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryVulnerabilityRepository>();
}

std::shared_ptr<vuln::VulnerabilityFeed> BuildVulnerabilityFeed(const refiner::runtime::config::RuntimeConfig& config) {
  const auto& vulnerability = config.vulnerability();

  if (vulnerability.has_http()) {
    const auto&           http = vulnerability.http();
    vuln::HttpFeedOptions options;
    if (!http.kev_catalog_url().empty()) options.kev_catalog_url = http.kev_catalog_url();
    if (!http.nvd_api_url().empty()) options.nvd_api_url = http.nvd_api_url();
    options.nvd_api_key = http.nvd_api_key();
    if (http.timeout_ms() > 0) options.timeout = std::chrono::milliseconds(http.timeout_ms());
    if (http.has_nvd_request_interval_ms()) options.nvd_request_interval = std::chrono::milliseconds(http.nvd_request_interval_ms());
    return std::make_shared<vuln::HttpVulnerabilityFeed>(std::move(options));
  }

  if (vulnerability.has_static_records()) {
    std::vector<model::VulnerabilityRecord> records;
    for (const auto& record : vulnerability.static_records().records()) {
      records.push_back(vuln::FromProto(record));
    }
    return std::make_shared<vuln::StaticVulnerabilityFeed>(std::move(records));
  }

  REFINER_LOG_WARN("no vulnerability feed configured; cited CVEs resolve from the cache only");
  return nullptr;
}

std::shared_ptr<vuln::VulnerabilityCatalog> BuildVulnerabilityCatalog(const refiner::runtime::config::RuntimeConfig& config,
                                                                      std::shared_ptr<db::VulnerabilityRepository> cache) {
  const auto& vulnerability = config.vulnerability();

  vuln::CatalogOptions options;
  if (vulnerability.has_cache_ttl_hours()) options.cache_ttl = std::chrono::hours(vulnerability.cache_ttl_hours());
  if (vulnerability.has_max_attempts()) options.max_attempts = vulnerability.max_attempts();
  if (vulnerability.has_initial_backoff_ms()) options.initial_backoff = std::chrono::milliseconds(vulnerability.initial_backoff_ms());
  if (vulnerability.has_cache_retention_hours()) options.cache_retention = std::chrono::hours(vulnerability.cache_retention_hours());

  return std::make_shared<vuln::VulnerabilityCatalog>(BuildVulnerabilityFeed(config), std::move(cache), options);
}

std::vector<model::Control> BuildControlRegistry(const refiner::runtime::config::RuntimeConfig& config) {
  ingest::RecordValidator     validator;
  std::vector<model::Control> controls;

  for (const auto& raw : config.controls().registry()) {
    try {
      controls.push_back(validator.ValidateControl(raw));
    } catch (const util::InvalidInput& e) {
      throw util::InvalidConfig("controls.registry entry '" + raw.name() + "': " + e.what());
    }
  }
  return controls;
}

std::shared_ptr<core::RefinementOrchestrator> BuildOrchestrator(const refiner::runtime::config::RuntimeConfig& config,
                                                                std::shared_ptr<vuln::VulnerabilityCatalog>    catalog) {
  auto refinement = refiner::config::BuildRefinementConfig(config);
  return std::make_shared<core::RefinementOrchestrator>(std::move(refinement), std::move(catalog), BuildControlRegistry(config));
}

/*
    Build full application dependency graph
*/
Application Build(const refiner::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Vulnerability intelligence
  // ------------------------------------------------------------------
  auto cache   = BuildVulnerabilityCache(config);
  auto catalog = BuildVulnerabilityCatalog(config, cache);
  catalog->PurgeRetired();

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  auto orchestrator = BuildOrchestrator(config, catalog);

  REFINER_LOG_INFO("refinement pipeline ready", {IntField("worker_threads", static_cast<std::int64_t>(orchestrator->Config().worker_threads)),
                                                 IntField("default_controls", config.controls().registry_size())});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.context.orchestrator        = orchestrator;
  app.context.catalog             = catalog;
  app.context.vulnerability_cache = cache;

  app.refinement_service = std::make_shared<service::RefinementService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RefinementServer>(app.refinement_service));

  return app;
}

} // namespace refiner::factory
