#pragma once

#include <cstdint>
#include <string_view>

namespace refiner::model {

enum class Industry : std::uint8_t {
  kGeneric    = 0,
  kFinance    = 1,
  kHealthcare = 2,
  kGovernment = 3,
};

constexpr std::string_view ToString(Industry industry) {
  switch (industry) {
    case Industry::kFinance:
      return "Finance";
    case Industry::kHealthcare:
      return "Healthcare";
    case Industry::kGovernment:
      return "Government";
    case Industry::kGeneric:
    default:
      return "Generic";
  }
}

} // namespace refiner::model
