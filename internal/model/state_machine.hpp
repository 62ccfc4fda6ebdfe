#pragma once

#include <cstdint>
#include <string_view>

namespace refiner::model {

enum class ThreatStatus : std::uint8_t {
  kActive     = 0,
  kSuppressed = 1,
  kMerged     = 2,
};

constexpr std::string_view ToString(ThreatStatus status) {
  switch (status) {
    case ThreatStatus::kSuppressed:
      return "suppressed";
    case ThreatStatus::kMerged:
      return "merged";
    case ThreatStatus::kActive:
    default:
      return "active";
  }
}

constexpr bool IsTerminal(ThreatStatus status) {
  return status == ThreatStatus::kSuppressed || status == ThreatStatus::kMerged;
}

constexpr bool CanTransition(ThreatStatus from, ThreatStatus to) {
  if (from == to) {
    return true;
  }
  return !IsTerminal(from);
}

} // namespace refiner::model
