#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/model/stride.hpp"

namespace refiner::model {

enum class Exploitability : std::uint8_t {
  kLow    = 0,
  kMedium = 1,
  kHigh   = 2,
};

enum class MitigationMaturity : std::uint8_t {
  kNone    = 0,
  kPartial = 1,
  kStrong  = 2,
};

enum class CveRelevance : std::uint8_t {
  kUnknown  = 0,
  kRelevant = 1,
  kStale    = 2,
};

constexpr std::string_view ToString(Exploitability value) {
  switch (value) {
    case Exploitability::kHigh:
      return "High";
    case Exploitability::kMedium:
      return "Medium";
    case Exploitability::kLow:
    default:
      return "Low";
  }
}

constexpr std::string_view ToString(MitigationMaturity value) {
  switch (value) {
    case MitigationMaturity::kStrong:
      return "Strong";
    case MitigationMaturity::kPartial:
      return "Partial";
    case MitigationMaturity::kNone:
    default:
      return "None";
  }
}

constexpr std::string_view ToString(CveRelevance value) {
  switch (value) {
    case CveRelevance::kRelevant:
      return "relevant";
    case CveRelevance::kStale:
      return "stale";
    case CveRelevance::kUnknown:
    default:
      return "unknown";
  }
}

struct CveAssessment {
  std::string  cve_id;
  CveRelevance relevance       = CveRelevance::kUnknown;
  bool         known_exploited = false;
};

/*
  Fields populated by the risk calculator and statement generator.
  Only active cluster representatives carry them.
*/
struct RiskFields {
  Exploitability     exploitability      = Exploitability::kLow;
  MitigationMaturity mitigation_maturity = MitigationMaturity::kNone;
  double             residual_risk       = 0.0;
  std::string        severity_band;
  std::string        business_impact_statement;
  std::string        justification;
  std::string        risk_statement;
};

/*
  A single finding.

  Created once at ingestion and mutated in place by pipeline stages.
  Never removed from the batch: suppressed and merged threats stay in the
  report for auditing.
*/
struct Threat {
  std::string id;

  std::string                component_ref;
  std::optional<std::string> canonical_component;
  bool                       unmatched_component = false;
  double                     match_score         = 0.0;

  StrideCategory stride_category = StrideCategory::kSpoofing;
  std::string    description;
  std::string    mitigation_suggestion;

  std::vector<std::string> additional_mitigations;
  std::vector<std::string> cited_cves;
  std::vector<std::string> other_references;

  double inherent_risk_score = 0.0;

  ThreatStatus               status = ThreatStatus::kActive;
  std::optional<std::string> suppressed_reason;
  std::optional<std::string> cluster_id;
  std::optional<std::string> merged_into;
  std::vector<std::string>   merged_from;

  std::vector<CveAssessment> cve_assessments;
  std::optional<RiskFields>  risk;

  bool IsActive() const {
    return status == ThreatStatus::kActive;
  }

  // Component name used for matching: canonical when standardized.
  const std::string& ComponentName() const {
    return canonical_component ? *canonical_component : component_ref;
  }
};

} // namespace refiner::model
