#include "risk_calculator.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include "internal/refine/transitions.hpp"
#include "internal/util/text.hpp"

namespace refiner::refine {

namespace {

constexpr double kMaxRisk = 10.0;

// [component type][stride category]
constexpr std::array<std::array<std::string_view, 6>, 4> kImpactTable = {{
    // External Entity
    {{
        "An impersonated external party could transact as a trusted partner",
        "Data supplied by the external party could be altered before it is trusted",
        "Actions taken by the external party could not be attributed or disputed",
        "Information shared with the external party could be exposed to third parties",
        "Loss of the external integration would interrupt dependent business processes",
        "The external party could obtain privileges beyond its agreed integration scope",
    }},
    // Process
    {{
        "Attackers could impersonate the service and capture user sessions or credentials",
        "Business logic could be manipulated to produce fraudulent or corrupted results",
        "Security-relevant operations could not be traced back to the responsible actor",
        "Sensitive data processed by the service could leak to unauthorized parties",
        "Service outage would halt customer-facing operations and revenue",
        "Attackers could gain administrative control over the service and its data",
    }},
    // Data Store
    {{
        "Forged identities could read or write stored records",
        "Stored records could be silently modified, undermining data integrity",
        "Changes to stored records could not be audited or reconstructed",
        "A breach of stored records could expose customer data at scale",
        "Unavailable storage would block every process that depends on the data",
        "Privileged database access could lead to full compromise of stored data",
    }},
    // Data Flow
    {{
        "Endpoints of the flow could be impersonated to intercept traffic",
        "Data in transit could be modified without detection",
        "Messages on the flow could be replayed or repudiated by their sender",
        "Data in transit could be intercepted and disclosed",
        "Disruption of the flow would break communication between components",
        "Abuse of the flow could let an attacker pivot to more privileged components",
    }},
}};

constexpr std::array<std::string_view, 6> kGenericImpact = {
    "Identity spoofing could give attackers access under a trusted identity",
    "Unauthorized modification could compromise data or process integrity",
    "Lack of accountability could hide malicious activity",
    "Unauthorized disclosure could expose confidential information",
    "Service disruption could interrupt business operations",
    "Privilege escalation could give attackers control beyond their authorization",
};

bool IsRegulated(std::string_view classification) {
  const auto value = util::ToLower(classification);
  return value == "pii" || value == "phi" || value == "pci" || value == "confidential";
}

double Round2(double value) {
  return std::round(value * 100.0) / 100.0;
}

} // namespace

std::string_view SeverityBand(double residual_risk) {
  if (residual_risk >= 8.0) return "Critical";
  if (residual_risk >= 6.0) return "High";
  if (residual_risk >= 3.0) return "Medium";
  return "Low";
}

std::string BusinessImpact(const model::Component* component, model::StrideCategory category) {
  const auto stride = static_cast<std::size_t>(category);
  if (!component) return std::string(kGenericImpact[stride]) + ".";

  std::string statement(kImpactTable[static_cast<std::size_t>(component->type)][stride]);
  if (IsRegulated(component->data_classification)) {
    statement += ", affecting " + component->data_classification + " data with regulatory implications";
  } else if (!component->data_classification.empty()) {
    statement += ", affecting " + component->data_classification + " data";
  }
  return statement + ".";
}

RiskCalculator::RiskCalculator(const std::vector<model::Component>& components,
                               const std::vector<model::Control>&   controls,
                               config::RiskWeights                  weights)
    : components_(components), controls_(controls), weights_(weights) {
}

const model::Component* RiskCalculator::FindComponent(const model::Threat& threat) const {
  if (!threat.canonical_component) return nullptr;
  for (const auto& component : components_) {
    if (component.canonical_name == *threat.canonical_component) return &component;
  }
  return nullptr;
}

model::Exploitability RiskCalculator::AssessExploitability(const model::Threat& threat) const {
  auto level = model::Exploitability::kLow;

  for (const auto& cve : threat.cited_cves) {
    auto it = std::find_if(threat.cve_assessments.begin(), threat.cve_assessments.end(),
                           [&](const model::CveAssessment& assessment) { return assessment.cve_id == cve; });

    // not assessed: unknown
    if (it == threat.cve_assessments.end()) {
      level = model::Exploitability::kMedium;
      continue;
    }

    if (it->known_exploited) return model::Exploitability::kHigh;
    if (it->relevance != model::CveRelevance::kStale) level = model::Exploitability::kMedium;
  }

  return level;
}

model::MitigationMaturity RiskCalculator::AssessMaturity(const model::Threat& threat) const {
  const auto& component = threat.ComponentName();

  bool global = false;
  for (const auto& control : controls_) {
    if (!control.Covers(threat.stride_category)) continue;
    if (control.AppliesToComponent(component)) return model::MitigationMaturity::kStrong;
    if (control.IsGlobal()) global = true;
  }

  return global ? model::MitigationMaturity::kPartial : model::MitigationMaturity::kNone;
}

double RiskCalculator::ResidualRisk(double inherent, model::Exploitability exploitability, model::MitigationMaturity maturity) const {
  double exploit_factor = weights_.exploitability_low;
  switch (exploitability) {
    case model::Exploitability::kHigh:
      exploit_factor = weights_.exploitability_high;
      break;
    case model::Exploitability::kMedium:
      exploit_factor = weights_.exploitability_medium;
      break;
    case model::Exploitability::kLow:
      break;
  }

  double maturity_factor = weights_.maturity_none;
  switch (maturity) {
    case model::MitigationMaturity::kStrong:
      maturity_factor = weights_.maturity_strong;
      break;
    case model::MitigationMaturity::kPartial:
      maturity_factor = weights_.maturity_partial;
      break;
    case model::MitigationMaturity::kNone:
      break;
  }

  return Round2(std::clamp(inherent * exploit_factor * maturity_factor, 0.0, kMaxRisk));
}

void RiskCalculator::Apply(model::Threat& threat) const {
  RequireActive(threat, "risk");
  if (!threat.cluster_id) {
    throw util::InvariantViolation("risk: threat " + threat.id + " has no cluster; deduplication must run first");
  }

  model::RiskFields risk;
  risk.exploitability      = AssessExploitability(threat);
  risk.mitigation_maturity = AssessMaturity(threat);
  risk.residual_risk       = ResidualRisk(threat.inherent_risk_score, risk.exploitability, risk.mitigation_maturity);
  risk.severity_band       = std::string(SeverityBand(risk.residual_risk));

  const auto* component          = FindComponent(threat);
  risk.business_impact_statement = BusinessImpact(component, threat.stride_category);

  std::string exploit_reason;
  switch (risk.exploitability) {
    case model::Exploitability::kHigh:
      exploit_reason = "a cited CVE is in the known-exploited catalog";
      break;
    case model::Exploitability::kMedium:
      exploit_reason = "cited CVEs are recent or unverified";
      break;
    case model::Exploitability::kLow:
      exploit_reason = threat.cited_cves.empty() ? "no CVE is cited" : "all cited CVEs are stale";
      break;
  }

  std::string maturity_reason;
  switch (risk.mitigation_maturity) {
    case model::MitigationMaturity::kStrong:
      maturity_reason = "a control scoped to " + threat.ComponentName() + " covers " + std::string(model::ToString(threat.stride_category));
      break;
    case model::MitigationMaturity::kPartial:
      maturity_reason = "only global controls cover " + std::string(model::ToString(threat.stride_category));
      break;
    case model::MitigationMaturity::kNone:
      maturity_reason = "no control covers " + std::string(model::ToString(threat.stride_category));
      break;
  }

  risk.justification = "Exploitability " + std::string(model::ToString(risk.exploitability)) + " because " + exploit_reason +
                       ". Mitigation maturity " + std::string(model::ToString(risk.mitigation_maturity)) + " because " + maturity_reason + ".";

  threat.risk = std::move(risk);
}

} // namespace refiner::refine
