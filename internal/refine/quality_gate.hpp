#pragma once

#include <optional>
#include <string>

#include "internal/config/refinement_config.hpp"
#include "internal/model/threat.hpp"

namespace refiner::refine {

/*
  Drops findings too vague to act on: short descriptions, descriptions
  built from stock phrases, and placeholder mitigations. Suppressed
  threats get suppressed_reason "low_quality".
*/
class QualityGate {
 public:
  explicit QualityGate(config::QualityOptions options);

  // Why the threat fails the gate; nullopt when it passes.
  std::optional<std::string> Evaluate(const model::Threat& threat) const;

  // Returns true when the threat was suppressed.
  bool Apply(model::Threat& threat) const;

 private:
  config::QualityOptions options_;
};

} // namespace refiner::refine
