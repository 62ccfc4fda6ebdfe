#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/refinement_orchestrator.hpp"
#include "internal/db/memory/memory_vulnerability_repository.hpp"
#include "internal/service/refinement_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/threat_mapping.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/vuln/static_vulnerability_feed.hpp"
#include "refiner/v1.hpp"

namespace {

using namespace refiner::v1;

refiner::service::ServiceContext BuildServiceContext() {
  refiner::model::VulnerabilityRecord stale;
  stale.cve_id         = "CVE-2012-1823";
  stale.published_date = *refiner::util::ParseDate("2012-05-11");

  refiner::model::VulnerabilityRecord exploited;
  exploited.cve_id                     = "CVE-2023-44487";
  exploited.published_date             = *refiner::util::ParseDate("2023-10-10");
  exploited.in_known_exploited_catalog = true;

  refiner::service::ServiceContext ctx;
  ctx.vulnerability_cache = std::make_shared<refiner::db::memory::MemoryVulnerabilityRepository>();
  ctx.catalog             = std::make_shared<refiner::vuln::VulnerabilityCatalog>(
      std::make_shared<refiner::vuln::StaticVulnerabilityFeed>(std::vector<refiner::model::VulnerabilityRecord>{stale, exploited}),
      ctx.vulnerability_cache);

  refiner::config::RefinementConfig config;
  config.worker_threads = 0;
  ctx.orchestrator      = std::make_shared<refiner::core::RefinementOrchestrator>(config, ctx.catalog);
  return ctx;
}

RefineThreatsRequest BuildRequest() {
  RefineThreatsRequest req;
  req.set_industry("Healthcare");
  *req.mutable_as_of() = refiner::util::ToProto(*refiner::util::ParseDate("2026-01-01"));

  auto* portal = req.add_components();
  portal->set_name("Patient Portal");
  portal->set_type("Process");
  portal->set_data_classification("PHI");

  auto* records = req.add_components();
  records->set_name("Records Store");
  records->set_type("Data Store");
  records->set_data_classification("PHI");

  auto* legacy = req.add_threats();
  legacy->set_id("T-1");
  legacy->set_component_name("Patient Portal");
  legacy->set_stride_category("Elevation of Privilege");
  legacy->set_threat_description("PHP-CGI argument injection lets a remote caller run code on the portal host.");
  legacy->set_mitigation_suggestion("Retire the CGI handler.");
  legacy->add_references("CVE-2012-1823");
  legacy->set_inherent_risk_score(8.0);

  auto* flood = req.add_threats();
  flood->set_id("T-2");
  flood->set_component_name("patient-portal");
  flood->set_stride_category("DoS");
  flood->set_threat_description("HTTP/2 rapid reset floods exhaust the portal's connection handling.");
  flood->set_mitigation_suggestion("Cap concurrent streams per connection.");
  flood->add_references("CVE-2023-44487");
  flood->add_references("https://www.cisa.gov/known-exploited-vulnerabilities-catalog");
  flood->set_inherent_risk_score(6.0);

  return req;
}

void TestEmptyRequestIsRejected() {
  refiner::service::RefinementService svc(BuildServiceContext());

  bool threw = false;
  try {
    (void)svc.RefineThreats(RefineThreatsRequest{});
  } catch (const refiner::util::InvalidInput&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingOrchestratorIsAConfigError() {
  bool threw = false;
  try {
    refiner::service::RefinementService svc(refiner::service::ServiceContext{});
  } catch (const refiner::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestResponseCarriesRefinedThreats() {
  refiner::service::RefinementService svc(BuildServiceContext());
  const auto                          resp = svc.RefineThreats(BuildRequest());

  assert(resp.threats_size() == 2);
  assert(resp.warnings_size() == 0);

  const auto& first = resp.threats(0);
  assert(first.id() == "T-2");
  assert(first.status() == THREAT_STATUS_ACTIVE);
  assert(first.stride_category() == STRIDE_CATEGORY_DENIAL_OF_SERVICE);
  assert(first.canonical_component() == "Patient Portal");
  assert(first.cited_cves_size() == 1);
  assert(first.other_references_size() == 1);
  assert(first.cve_assessments_size() == 1);
  assert(first.cve_assessments(0).relevance() == CVE_RELEVANCE_RELEVANT);
  assert(first.cve_assessments(0).known_exploited());
  assert(first.has_risk());
  assert(first.risk().exploitability() == EXPLOITABILITY_HIGH);
  assert(first.risk().mitigation_maturity() == MITIGATION_MATURITY_NONE);
  assert(first.risk().residual_risk() == 7.5);
  assert(first.risk().severity_band() == "High");
  assert(first.risk().risk_statement().find("delay patient care") != std::string::npos);
  assert(!first.cluster_id().empty());

  const auto& second = resp.threats(1);
  assert(second.id() == "T-1");
  assert(second.status() == THREAT_STATUS_SUPPRESSED);
  assert(second.suppressed_reason() == "stale_cve");
  assert(second.cve_assessments(0).relevance() == CVE_RELEVANCE_STALE);
  assert(!second.has_risk());
  assert(second.cluster_id().empty());

  const auto& stats = resp.statistics();
  assert(stats.original_count() == 2);
  assert(stats.suppressed_stale_cve() == 1);
  assert(stats.final_count() == 1);
  assert(stats.high_count() == 1);
}

void TestResolvedRecordsAreCached() {
  auto                                ctx = BuildServiceContext();
  refiner::service::RefinementService svc(ctx);
  (void)svc.RefineThreats(BuildRequest());

  const auto cached = ctx.vulnerability_cache->List();
  assert(cached.size() == 2);
  assert(cached[0].cve_id == "CVE-2012-1823");
  assert(cached[1].cve_id == "CVE-2023-44487");
}

} // namespace

int main() {
  TestEmptyRequestIsRejected();
  TestMissingOrchestratorIsAConfigError();
  TestResponseCarriesRefinedThreats();
  TestResolvedRecordsAreCached();

  std::cout << "threat_refiner_unit_refinement_service: pass\n";
  return 0;
}
