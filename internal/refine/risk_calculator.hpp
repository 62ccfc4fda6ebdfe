#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/config/refinement_config.hpp"
#include "internal/model/component.hpp"
#include "internal/model/control.hpp"
#include "internal/model/threat.hpp"

namespace refiner::refine {

/*
  Derives exploitability, mitigation maturity and residual risk for the
  active cluster representatives.

    exploitability  High    any cited CVE is known-exploited
                    Medium  any cited CVE is not stale (unknown counts)
                    Low     otherwise
    maturity        Strong  a control naming the component covers the category
                    Partial only a global control covers it
                    None    otherwise
    residual        clamp(inherent * exploit_factor * maturity_factor, 0, 10)

  Requires a threat that is active and already clustered; anything else
  is an ordering bug and throws InvariantViolation.
*/
class RiskCalculator {
 public:
  RiskCalculator(const std::vector<model::Component>& components, const std::vector<model::Control>& controls, config::RiskWeights weights);

  model::Exploitability     AssessExploitability(const model::Threat& threat) const;
  model::MitigationMaturity AssessMaturity(const model::Threat& threat) const;

  double ResidualRisk(double inherent, model::Exploitability exploitability, model::MitigationMaturity maturity) const;

  void Apply(model::Threat& threat) const;

 private:
  const model::Component* FindComponent(const model::Threat& threat) const;

  const std::vector<model::Component>& components_;
  const std::vector<model::Control>&   controls_;
  config::RiskWeights                  weights_;
};

// Critical >= 8, High >= 6, Medium >= 3, Low otherwise.
std::string_view SeverityBand(double residual_risk);

// Consequence sentence for a STRIDE category on a component type.
std::string BusinessImpact(const model::Component* component, model::StrideCategory category);

} // namespace refiner::refine
