#include "internal/refine/cve_relevance_filter.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using refiner::model::CveRelevance;
using refiner::model::Threat;
using refiner::model::ThreatStatus;
using refiner::model::VulnerabilityRecord;
using refiner::refine::CveRelevanceFilter;
using refiner::util::ParseDate;
using refiner::vuln::VulnerabilitySnapshot;

VulnerabilityRecord MakeRecord(const std::string& id, const std::string& published, bool known_exploited) {
  VulnerabilityRecord record;
  record.cve_id = id;
  if (!published.empty()) record.published_date = *ParseDate(published);
  record.in_known_exploited_catalog = known_exploited;
  return record;
}

Threat MakeThreat(std::vector<std::string> cves, std::vector<std::string> other_references = {}) {
  Threat threat;
  threat.id                  = "T-1";
  threat.component_ref       = "Web Server";
  threat.canonical_component = "Web Server";
  threat.cited_cves          = std::move(cves);
  threat.other_references    = std::move(other_references);
  return threat;
}

const refiner::util::Date kAsOf = *ParseDate("2026-01-15");

void TestEightYearOldCveOutsideCatalogIsSuppressed() {
  VulnerabilitySnapshot snapshot({MakeRecord("CVE-2018-1000", "2018-01-10", false)});
  CveRelevanceFilter    filter(snapshot, kAsOf, 5);

  auto threat = MakeThreat({"CVE-2018-1000"});
  assert(filter.Apply(threat));
  assert(threat.status == ThreatStatus::kSuppressed);
  assert(*threat.suppressed_reason == "stale_cve");
  assert(threat.cve_assessments.size() == 1);
  assert(threat.cve_assessments[0].relevance == CveRelevance::kStale);
  assert(!threat.cve_assessments[0].known_exploited);
}

void TestKnownExploitedCveStaysRelevant() {
  VulnerabilitySnapshot snapshot({MakeRecord("CVE-2018-1000", "2018-01-10", true)});
  CveRelevanceFilter    filter(snapshot, kAsOf, 5);

  auto threat = MakeThreat({"CVE-2018-1000"});
  assert(!filter.Apply(threat));
  assert(threat.status == ThreatStatus::kActive);
  assert(threat.cve_assessments[0].relevance == CveRelevance::kRelevant);
  assert(threat.cve_assessments[0].known_exploited);
}

void TestOtherReferencesJustifyStaleThreat() {
  VulnerabilitySnapshot snapshot({MakeRecord("CVE-2018-1000", "2018-01-10", false)});
  CveRelevanceFilter    filter(snapshot, kAsOf, 5);

  auto threat = MakeThreat({"CVE-2018-1000"}, {"CWE-79"});
  assert(!filter.Apply(threat));
  assert(threat.status == ThreatStatus::kActive);
  assert(threat.cve_assessments[0].relevance == CveRelevance::kStale);
}

void TestThreatWithoutCvesIsUntouched() {
  VulnerabilitySnapshot snapshot;
  CveRelevanceFilter    filter(snapshot, kAsOf, 5);

  auto threat = MakeThreat({});
  assert(!filter.Apply(threat));
  assert(threat.status == ThreatStatus::kActive);
  assert(threat.cve_assessments.empty());
}

void TestUnknownRecordsFailOpen() {
  VulnerabilitySnapshot snapshot({MakeRecord("CVE-2018-1000", "2018-01-10", false), MakeRecord("CVE-2019-2000", "", false)});
  CveRelevanceFilter    filter(snapshot, kAsOf, 5);

  auto missing = MakeThreat({"CVE-2017-9999"});
  assert(!filter.Apply(missing));
  assert(missing.cve_assessments[0].relevance == CveRelevance::kUnknown);

  auto mixed = MakeThreat({"CVE-2018-1000", "CVE-2017-9999"});
  assert(!filter.Apply(mixed));
  assert(mixed.status == ThreatStatus::kActive);
  assert(mixed.cve_assessments[0].relevance == CveRelevance::kStale);
  assert(mixed.cve_assessments[1].relevance == CveRelevance::kUnknown);

  auto undated = MakeThreat({"CVE-2019-2000"});
  assert(!filter.Apply(undated));
  assert(undated.cve_assessments[0].relevance == CveRelevance::kUnknown);
}

void TestOneRelevantCveKeepsThreatActive() {
  VulnerabilitySnapshot snapshot({MakeRecord("CVE-2018-1000", "2018-01-10", false), MakeRecord("CVE-2024-3000", "2024-06-01", false)});
  CveRelevanceFilter    filter(snapshot, kAsOf, 5);

  auto threat = MakeThreat({"CVE-2018-1000", "CVE-2024-3000"});
  assert(!filter.Apply(threat));
  assert(threat.cve_assessments[1].relevance == CveRelevance::kRelevant);
}

void TestStalenessBoundaryIsExclusive() {
  VulnerabilitySnapshot snapshot({MakeRecord("CVE-2021-0001", "2021-01-15", false), MakeRecord("CVE-2021-0002", "2021-01-14", false)});
  CveRelevanceFilter    filter(snapshot, kAsOf, 5);

  assert(filter.Assess("CVE-2021-0001").relevance == CveRelevance::kRelevant);
  assert(filter.Assess("CVE-2021-0002").relevance == CveRelevance::kStale);

  CveRelevanceFilter wider(snapshot, kAsOf, 10);
  assert(wider.Assess("CVE-2021-0002").relevance == CveRelevance::kRelevant);
}

void TestSuppressedThreatIsNotReassessed() {
  VulnerabilitySnapshot snapshot({MakeRecord("CVE-2018-1000", "2018-01-10", false)});
  CveRelevanceFilter    filter(snapshot, kAsOf, 5);

  auto threat              = MakeThreat({"CVE-2018-1000"});
  threat.status            = ThreatStatus::kSuppressed;
  threat.suppressed_reason = "control:WAF";

  assert(!filter.Apply(threat));
  assert(*threat.suppressed_reason == "control:WAF");
  assert(threat.cve_assessments.empty());
}

} // namespace

int main() {
  TestEightYearOldCveOutsideCatalogIsSuppressed();
  TestKnownExploitedCveStaysRelevant();
  TestOtherReferencesJustifyStaleThreat();
  TestThreatWithoutCvesIsUntouched();
  TestUnknownRecordsFailOpen();
  TestOneRelevantCveKeepsThreatActive();
  TestStalenessBoundaryIsExclusive();
  TestSuppressedThreatIsNotReassessed();

  std::cout << "threat_refiner_unit_cve_relevance_filter: pass\n";
  return 0;
}
