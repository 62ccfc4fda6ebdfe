#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/refinement_config.hpp"
#include "internal/model/component.hpp"
#include "internal/model/industry.hpp"
#include "internal/model/threat.hpp"

namespace refiner::refine {

/*
  Renders the business-facing risk statement of a scored threat.

  Templates are keyed by (STRIDE category, industry); a category without
  an industry-specific template falls back to its generic one. Supported
  placeholders: {component} {residual_risk} {severity} {business_impact}
  {description}. Never changes risk values.
*/
class StatementGenerator {
 public:
  StatementGenerator(model::Industry                             industry,
                     const std::vector<config::TemplateOverride>& overrides,
                     const std::vector<model::Component>&         components);

  const std::string& TemplateFor(model::StrideCategory category) const;

  std::string Render(const model::Threat& threat) const;

  void Apply(model::Threat& threat) const;

 private:
  using Key = std::pair<model::StrideCategory, std::optional<model::Industry>>;

  model::Industry                      industry_;
  std::map<Key, std::string>           templates_;
  const std::vector<model::Component>& components_;
};

} // namespace refiner::refine
