#include "internal/refine/statement_generator.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using refiner::config::TemplateOverride;
using refiner::model::Component;
using refiner::model::ComponentType;
using refiner::model::Industry;
using refiner::model::RiskFields;
using refiner::model::StrideCategory;
using refiner::model::Threat;
using refiner::refine::StatementGenerator;

const std::vector<Component> kComponents = {
    Component{"Payment API", ComponentType::kProcess, "", "PCI"},
    Component{"Records Database", ComponentType::kDataStore, "", "PHI"},
};

Threat MakeScoredThreat(const std::string& component, StrideCategory category, double residual) {
  Threat threat;
  threat.id                  = "T-1";
  threat.component_ref       = component;
  threat.canonical_component = component;
  threat.stride_category     = category;
  threat.description         = "Callback replay";

  RiskFields risk;
  risk.residual_risk             = residual;
  risk.severity_band             = "High";
  risk.business_impact_statement = "Business logic could be manipulated.";
  threat.risk                    = risk;
  return threat;
}

void TestGenericTemplateIsInterpolated() {
  StatementGenerator generator(Industry::kGeneric, {}, kComponents);

  auto threat = MakeScoredThreat("Payment API", StrideCategory::kTampering, 6.24);
  generator.Apply(threat);

  assert(threat.risk->risk_statement ==
         "High risk (6.2/10): unauthorized modification of Payment API. Business logic could be manipulated.");
}

void TestIndustryTemplateWinsAndFallsBack() {
  StatementGenerator generator(Industry::kFinance, {}, kComponents);

  auto tampering = MakeScoredThreat("Payment API", StrideCategory::kTampering, 7.0);
  const auto text = generator.Render(tampering);
  assert(text.find("transaction amounts or ledgers") != std::string::npos);
  assert(text.find("PCI-DSS compliance violations") != std::string::npos);

  // no finance template for repudiation
  assert(generator.TemplateFor(StrideCategory::kRepudiation).find("cannot be reliably attributed") != std::string::npos);
}

void TestHipaaSentenceOnlyForHealthcarePhi() {
  StatementGenerator healthcare(Industry::kHealthcare, {}, kComponents);
  StatementGenerator finance(Industry::kFinance, {}, kComponents);

  auto threat = MakeScoredThreat("Records Database", StrideCategory::kInformationDisclosure, 8.0);
  assert(healthcare.Render(threat).find("HIPAA") != std::string::npos);
  assert(finance.Render(threat).find("HIPAA") == std::string::npos);
  assert(finance.Render(threat).find("PCI-DSS") == std::string::npos);
}

void TestOverridesReplaceDefaults() {
  std::vector<TemplateOverride> overrides = {
      TemplateOverride{StrideCategory::kDenialOfService, Industry::kFinance, "{component} down: {severity} at {residual_risk} ({description})"},
      TemplateOverride{StrideCategory::kSpoofing, std::nullopt, "Generic spoofing of {component}"},
  };
  const std::vector<Component> no_components;
  StatementGenerator           generator(Industry::kFinance, overrides, no_components);

  auto dos = MakeScoredThreat("Payment API", StrideCategory::kDenialOfService, 9.0);
  assert(generator.Render(dos) == "Payment API down: High at 9.0 (Callback replay)");

  // finance keeps its own spoofing template; the generic override only changes the fallback
  StatementGenerator government(Industry::kGovernment, overrides, no_components);
  auto               spoof = MakeScoredThreat("Portal", StrideCategory::kSpoofing, 2.0);
  assert(government.Render(spoof) == "Generic spoofing of Portal");
  assert(generator.Render(spoof).find("account takeover") != std::string::npos);
}

void TestRiskValuesAreUntouched() {
  StatementGenerator generator(Industry::kHealthcare, {}, kComponents);

  auto       threat = MakeScoredThreat("Records Database", StrideCategory::kTampering, 4.4);
  const auto before = *threat.risk;
  generator.Apply(threat);

  assert(threat.risk->residual_risk == before.residual_risk);
  assert(threat.risk->severity_band == before.severity_band);
  assert(threat.risk->business_impact_statement == before.business_impact_statement);
  assert(!threat.risk->risk_statement.empty());
}

void TestUnscoredThreatIsAnInvariantViolation() {
  StatementGenerator generator(Industry::kGeneric, {}, kComponents);

  auto threat = MakeScoredThreat("Payment API", StrideCategory::kTampering, 1.0);
  threat.risk.reset();

  bool threw = false;
  try {
    generator.Apply(threat);
  } catch (const refiner::util::InvariantViolation&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGenericTemplateIsInterpolated();
  TestIndustryTemplateWinsAndFallsBack();
  TestHipaaSentenceOnlyForHealthcarePhi();
  TestOverridesReplaceDefaults();
  TestRiskValuesAreUntouched();
  TestUnscoredThreatIsAnInvariantViolation();

  std::cout << "threat_refiner_unit_statement_generator: pass\n";
  return 0;
}
