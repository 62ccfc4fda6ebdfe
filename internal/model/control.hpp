#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/stride.hpp"

namespace refiner::model {

inline constexpr std::string_view kGlobalScope = "global";

/*
  An implemented security control.

  applies_to holds canonical component names; the literal "global"
  scopes the control to every component.
*/
struct Control {
  std::string              name;
  std::string              category;
  StrideSet                coverage;
  std::vector<std::string> applies_to;

  bool Covers(StrideCategory category_) const {
    return coverage.Contains(category_);
  }

  bool IsGlobal() const {
    return std::find(applies_to.begin(), applies_to.end(), kGlobalScope) != applies_to.end();
  }

  bool AppliesToComponent(std::string_view canonical_name) const {
    return std::find(applies_to.begin(), applies_to.end(), canonical_name) != applies_to.end();
  }
};

} // namespace refiner::model
