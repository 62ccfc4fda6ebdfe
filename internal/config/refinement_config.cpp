#include "refinement_config.hpp"

#include <string>

#include "config/config.pb.h"
#include "internal/model/enum_parsing.hpp"
#include "internal/util/errors.hpp"

namespace refiner::config {

namespace {

void RequireUnitInterval(double value, const char* name) {
  if (!(value > 0.0 && value <= 1.0)) {
    throw util::InvalidConfig(std::string(name) + " must be in (0, 1], got " + std::to_string(value));
  }
}

TemplateOverride ToOverride(const refiner::runtime::config::StatementTemplate& proto) {
  TemplateOverride result;

  auto stride = model::ParseStrideCategory(proto.stride_category());
  if (!stride) {
    throw util::InvalidConfig("statement template has unknown stride_category '" + proto.stride_category() + "'");
  }
  result.stride_category = *stride;

  if (!proto.industry().empty()) {
    auto industry = model::ParseIndustry(proto.industry());
    if (!industry) {
      throw util::InvalidConfig("statement template has unknown industry '" + proto.industry() + "'");
    }
    // "Generic" templates replace the fallback
    if (*industry != model::Industry::kGeneric) {
      result.industry = *industry;
    }
  }

  if (proto.text().empty()) {
    throw util::InvalidConfig("statement template text must not be empty");
  }
  result.text = proto.text();
  return result;
}

} // namespace

RefinementConfig BuildRefinementConfig(const refiner::runtime::config::RuntimeConfig& config) {
  RefinementConfig result;

  if (config.pipeline().has_worker_threads()) {
    result.worker_threads = config.pipeline().worker_threads();
  }

  if (config.standardizer().has_acceptance_threshold()) {
    result.acceptance_threshold = config.standardizer().acceptance_threshold();
  }

  if (config.controls().has_suppress_matches()) {
    result.suppress_matching_controls = config.controls().suppress_matches();
  }

  if (config.cve().has_staleness_years()) {
    result.cve_staleness_years = static_cast<int>(config.cve().staleness_years());
  }

  const auto& dedup = config.dedup();
  if (dedup.has_similarity_threshold()) result.similarity_threshold = dedup.similarity_threshold();
  if (dedup.has_require_same_component()) result.require_same_component = dedup.require_same_component();
  if (dedup.has_embedding_dimensions()) result.embedding_dimensions = dedup.embedding_dimensions();

  const auto& risk = config.risk();
  if (risk.has_exploitability_low()) result.risk.exploitability_low = risk.exploitability_low();
  if (risk.has_exploitability_medium()) result.risk.exploitability_medium = risk.exploitability_medium();
  if (risk.has_exploitability_high()) result.risk.exploitability_high = risk.exploitability_high();
  if (risk.has_maturity_none()) result.risk.maturity_none = risk.maturity_none();
  if (risk.has_maturity_partial()) result.risk.maturity_partial = risk.maturity_partial();
  if (risk.has_maturity_strong()) result.risk.maturity_strong = risk.maturity_strong();

  const auto& statements = config.statements();
  if (!statements.default_industry().empty()) {
    auto industry = model::ParseIndustry(statements.default_industry());
    if (!industry) {
      throw util::InvalidConfig("unknown statements.default_industry '" + statements.default_industry() + "'");
    }
    result.default_industry = *industry;
  }
  for (const auto& tmpl : statements.templates()) {
    result.templates.push_back(ToOverride(tmpl));
  }

  const auto& quality    = config.quality();
  result.quality.enabled = quality.enabled();
  if (quality.has_min_description_length()) result.quality.min_description_length = quality.min_description_length();
  if (quality.has_min_mitigation_length()) result.quality.min_mitigation_length = quality.min_mitigation_length();
  if (quality.has_max_generic_phrases()) result.quality.max_generic_phrases = quality.max_generic_phrases();

  Validate(result);
  return result;
}

void Validate(const RefinementConfig& config) {
  RequireUnitInterval(config.acceptance_threshold, "standardizer.acceptance_threshold");
  RequireUnitInterval(config.similarity_threshold, "dedup.similarity_threshold");

  if (config.cve_staleness_years <= 0) {
    throw util::InvalidConfig("cve.staleness_years must be positive");
  }
  if (config.embedding_dimensions < 16) {
    throw util::InvalidConfig("dedup.embedding_dimensions must be at least 16");
  }
  if (config.worker_threads > 256) {
    throw util::InvalidConfig("pipeline.worker_threads must not exceed 256");
  }

  const auto& w = config.risk;
  if (w.exploitability_low < 0.0 || w.maturity_strong < 0.0) {
    throw util::InvalidConfig("risk factors must not be negative");
  }
  if (!(w.exploitability_low <= w.exploitability_medium && w.exploitability_medium <= w.exploitability_high)) {
    throw util::InvalidConfig("risk.exploitability factors must be non-decreasing low <= medium <= high");
  }
  if (!(w.maturity_strong <= w.maturity_partial && w.maturity_partial <= w.maturity_none)) {
    throw util::InvalidConfig("risk.maturity factors must be non-increasing none >= partial >= strong");
  }
}

} // namespace refiner::config
