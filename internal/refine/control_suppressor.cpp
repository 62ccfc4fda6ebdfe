#include "control_suppressor.hpp"

#include "internal/refine/transitions.hpp"

namespace refiner::refine {

ControlSuppressor::ControlSuppressor(const std::vector<model::Control>& controls, bool suppress_matches)
    : controls_(controls), suppress_matches_(suppress_matches) {
}

const model::Control* ControlSuppressor::FindCoveringControl(const model::Threat& threat) const {
  if (threat.unmatched_component || !threat.canonical_component) return nullptr;

  for (const auto& control : controls_) {
    if (!control.Covers(threat.stride_category)) continue;
    if (control.IsGlobal() || control.AppliesToComponent(*threat.canonical_component)) return &control;
  }
  return nullptr;
}

bool ControlSuppressor::Apply(model::Threat& threat) const {
  if (!suppress_matches_ || !threat.IsActive()) return false;

  const auto* control = FindCoveringControl(threat);
  if (!control) return false;

  Suppress(threat, "control:" + control->name);
  return true;
}

} // namespace refiner::refine
