#include "internal/refine/risk_calculator.hpp"

#include <array>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using refiner::model::Component;
using refiner::model::ComponentType;
using refiner::model::Control;
using refiner::model::CveAssessment;
using refiner::model::CveRelevance;
using refiner::model::Exploitability;
using refiner::model::MitigationMaturity;
using refiner::model::StrideCategory;
using refiner::model::Threat;
using refiner::refine::RiskCalculator;

Control MakeControl(const std::string& name, StrideCategory category, const std::string& applies_to) {
  Control control;
  control.name = name;
  control.coverage.Insert(category);
  control.applies_to = {applies_to};
  return control;
}

Threat MakeThreat(const std::string& component, StrideCategory category, double score) {
  Threat threat;
  threat.id                  = "T-1";
  threat.component_ref       = component;
  threat.canonical_component = component;
  threat.stride_category     = category;
  threat.inherent_risk_score = score;
  threat.cluster_id          = "cluster-1";
  return threat;
}

const std::vector<Component> kComponents = {
    Component{"Payment API", ComponentType::kProcess, "", "PCI"},
    Component{"Audit Log", ComponentType::kDataStore, "", ""},
};

void TestExploitabilityLevels() {
  std::vector<Control> controls;
  RiskCalculator       calculator(kComponents, controls, {});

  auto none = MakeThreat("Payment API", StrideCategory::kTampering, 5.0);
  assert(calculator.AssessExploitability(none) == Exploitability::kLow);

  auto stale            = none;
  stale.cited_cves      = {"CVE-2015-0001"};
  stale.cve_assessments = {CveAssessment{"CVE-2015-0001", CveRelevance::kStale, false}};
  assert(calculator.AssessExploitability(stale) == Exploitability::kLow);

  auto unknown            = none;
  unknown.cited_cves      = {"CVE-2015-0001", "CVE-2024-0002"};
  unknown.cve_assessments = {CveAssessment{"CVE-2015-0001", CveRelevance::kStale, false},
                             CveAssessment{"CVE-2024-0002", CveRelevance::kUnknown, false}};
  assert(calculator.AssessExploitability(unknown) == Exploitability::kMedium);

  auto exploited            = none;
  exploited.cited_cves      = {"CVE-2015-0001"};
  exploited.cve_assessments = {CveAssessment{"CVE-2015-0001", CveRelevance::kRelevant, true}};
  assert(calculator.AssessExploitability(exploited) == Exploitability::kHigh);
}

void TestMaturityPrefersComponentScopedControls() {
  std::vector<Control> controls = {
      MakeControl("WAF", StrideCategory::kTampering, "global"),
      MakeControl("Request Signing", StrideCategory::kTampering, "Payment API"),
      MakeControl("SSO", StrideCategory::kSpoofing, "global"),
  };
  RiskCalculator calculator(kComponents, controls, {});

  assert(calculator.AssessMaturity(MakeThreat("Payment API", StrideCategory::kTampering, 5.0)) == MitigationMaturity::kStrong);
  assert(calculator.AssessMaturity(MakeThreat("Audit Log", StrideCategory::kTampering, 5.0)) == MitigationMaturity::kPartial);
  assert(calculator.AssessMaturity(MakeThreat("Audit Log", StrideCategory::kRepudiation, 5.0)) == MitigationMaturity::kNone);
}

void TestResidualRiskIsMonotonic() {
  std::vector<Control> controls;
  RiskCalculator       calculator(kComponents, controls, {});

  const std::array<Exploitability, 3>     exploits   = {Exploitability::kLow, Exploitability::kMedium, Exploitability::kHigh};
  const std::array<MitigationMaturity, 3> maturities = {MitigationMaturity::kNone, MitigationMaturity::kPartial, MitigationMaturity::kStrong};

  for (double inherent : {0.0, 2.5, 6.0, 9.5, 10.0}) {
    for (std::size_t e = 0; e < exploits.size(); ++e) {
      for (std::size_t m = 0; m < maturities.size(); ++m) {
        const double residual = calculator.ResidualRisk(inherent, exploits[e], maturities[m]);
        assert(residual >= 0.0 && residual <= 10.0);
        if (e + 1 < exploits.size()) assert(calculator.ResidualRisk(inherent, exploits[e + 1], maturities[m]) >= residual);
        if (m + 1 < maturities.size()) assert(calculator.ResidualRisk(inherent, exploits[e], maturities[m + 1]) <= residual);
      }
    }
  }

  assert(calculator.ResidualRisk(9.5, Exploitability::kHigh, MitigationMaturity::kNone) == 10.0);
  assert(calculator.ResidualRisk(6.0, Exploitability::kMedium, MitigationMaturity::kPartial) == 4.2);
  assert(calculator.ResidualRisk(5.0, Exploitability::kLow, MitigationMaturity::kStrong) == 1.6);
}

void TestSeverityBands() {
  using refiner::refine::SeverityBand;
  assert(SeverityBand(10.0) == "Critical");
  assert(SeverityBand(8.0) == "Critical");
  assert(SeverityBand(7.99) == "High");
  assert(SeverityBand(6.0) == "High");
  assert(SeverityBand(3.0) == "Medium");
  assert(SeverityBand(2.99) == "Low");
  assert(SeverityBand(0.0) == "Low");
}

void TestApplyFillsDerivedFields() {
  std::vector<Control> controls = {MakeControl("WAF", StrideCategory::kTampering, "global")};
  RiskCalculator       calculator(kComponents, controls, {});

  auto threat            = MakeThreat("Payment API", StrideCategory::kTampering, 8.0);
  threat.cited_cves      = {"CVE-2023-0001"};
  threat.cve_assessments = {CveAssessment{"CVE-2023-0001", CveRelevance::kRelevant, true}};
  calculator.Apply(threat);

  assert(threat.risk.has_value());
  assert(threat.risk->exploitability == Exploitability::kHigh);
  assert(threat.risk->mitigation_maturity == MitigationMaturity::kPartial);
  assert(threat.risk->residual_risk == 7.0);
  assert(threat.risk->severity_band == "High");
  assert(threat.risk->business_impact_statement.find("PCI data with regulatory implications") != std::string::npos);
  assert(threat.risk->justification.find("known-exploited") != std::string::npos);
  assert(threat.risk->justification.find("only global controls") != std::string::npos);
  assert(threat.inherent_risk_score == 8.0);
}

void TestBusinessImpactFallsBackForUnknownComponents() {
  const auto generic = refiner::refine::BusinessImpact(nullptr, StrideCategory::kDenialOfService);
  assert(generic == "Service disruption could interrupt business operations.");

  const auto store = refiner::refine::BusinessImpact(&kComponents[1], StrideCategory::kRepudiation);
  assert(store == "Changes to stored records could not be audited or reconstructed.");
}

void TestOutOfOrderThreatsAreRejected() {
  std::vector<Control> controls;
  RiskCalculator       calculator(kComponents, controls, {});

  auto unclustered = MakeThreat("Payment API", StrideCategory::kTampering, 5.0);
  unclustered.cluster_id.reset();

  auto suppressed              = MakeThreat("Payment API", StrideCategory::kTampering, 5.0);
  suppressed.status            = refiner::model::ThreatStatus::kSuppressed;
  suppressed.suppressed_reason = "stale_cve";

  for (auto* threat : {&unclustered, &suppressed}) {
    bool threw = false;
    try {
      calculator.Apply(*threat);
    } catch (const refiner::util::InvariantViolation&) {
      threw = true;
    }
    assert(threw);
    assert(!threat->risk.has_value());
  }
}

} // namespace

int main() {
  TestExploitabilityLevels();
  TestMaturityPrefersComponentScopedControls();
  TestResidualRiskIsMonotonic();
  TestSeverityBands();
  TestApplyFillsDerivedFields();
  TestBusinessImpactFallsBackForUnknownComponents();
  TestOutOfOrderThreatsAreRejected();

  std::cout << "threat_refiner_unit_risk_calculator: pass\n";
  return 0;
}
