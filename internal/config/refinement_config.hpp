#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/industry.hpp"
#include "internal/model/stride.hpp"

namespace refiner::runtime::config {
class RuntimeConfig;
}

namespace refiner::config {

/*
  Multipliers applied to inherent risk. Exploitability factors must be
  non-decreasing Low -> High and maturity factors non-increasing
  None -> Strong so residual risk stays monotonic.
*/
struct RiskWeights {
  double exploitability_low    = 0.8;
  double exploitability_medium = 1.0;
  double exploitability_high   = 1.25;

  double maturity_none    = 1.0;
  double maturity_partial = 0.7;
  double maturity_strong  = 0.4;
};

struct TemplateOverride {
  model::StrideCategory          stride_category = model::StrideCategory::kSpoofing;
  std::optional<model::Industry> industry;  // nullopt: generic fallback
  std::string                    text;
};

struct QualityOptions {
  bool        enabled                = false;
  std::size_t min_description_length = 50;
  std::size_t min_mitigation_length  = 30;
  std::size_t max_generic_phrases    = 2;
};

/*
  Immutable per-run configuration handed to the orchestrator.

  Built once from RuntimeConfig with defaults applied; never read from
  process-wide state during a run.
*/
struct RefinementConfig {
  std::size_t worker_threads = 4;

  double acceptance_threshold = 0.6;

  bool suppress_matching_controls = true;

  int cve_staleness_years = 5;

  double      similarity_threshold   = 0.85;
  bool        require_same_component = true;
  std::size_t embedding_dimensions   = 512;

  RiskWeights risk;

  model::Industry               default_industry = model::Industry::kGeneric;
  std::vector<TemplateOverride> templates;

  QualityOptions quality;
};

// Applies defaults for unset fields and validates. Throws util::InvalidConfig.
RefinementConfig BuildRefinementConfig(const refiner::runtime::config::RuntimeConfig& config);

void Validate(const RefinementConfig& config);

} // namespace refiner::config
