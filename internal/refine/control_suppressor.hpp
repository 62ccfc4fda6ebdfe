#pragma once

#include <vector>

#include "internal/model/control.hpp"
#include "internal/model/threat.hpp"

namespace refiner::refine {

/*
  Suppresses active, matched threats already covered by an implemented
  control. A control covers a threat when its coverage includes the
  threat's STRIDE category and it applies to the canonical component or
  globally. The first covering control in list order is recorded as
  "control:<name>".

  With suppression disabled the stage only reports (FindCoveringControl)
  and leaves statuses untouched.
*/
class ControlSuppressor {
 public:
  ControlSuppressor(const std::vector<model::Control>& controls, bool suppress_matches);

  const model::Control* FindCoveringControl(const model::Threat& threat) const;

  // Returns true when the threat was suppressed.
  bool Apply(model::Threat& threat) const;

 private:
  const std::vector<model::Control>& controls_;
  bool                               suppress_matches_;
};

} // namespace refiner::refine
