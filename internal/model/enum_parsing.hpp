#pragma once

#include <optional>
#include <string_view>

#include "internal/model/component.hpp"
#include "internal/model/industry.hpp"
#include "internal/model/stride.hpp"

namespace refiner::model {

/*
  Lenient parsers for the loosely worded labels upstream generators emit.

  Matching is case-insensitive and ignores punctuation, so "S",
  "Spoofing", "information-disclosure" and "STRIDE_CATEGORY_TAMPERING"
  are all accepted.
*/
std::optional<StrideCategory> ParseStrideCategory(std::string_view text);
std::optional<ComponentType>  ParseComponentType(std::string_view text);
std::optional<Industry>       ParseIndustry(std::string_view text);

} // namespace refiner::model
