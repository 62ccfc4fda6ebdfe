#pragma once

#include <cstdint>
#include <string_view>

namespace refiner::model {

enum class StrideCategory : std::uint8_t {
  kSpoofing              = 0,
  kTampering             = 1,
  kRepudiation           = 2,
  kInformationDisclosure = 3,
  kDenialOfService       = 4,
  kElevationOfPrivilege  = 5,
};

constexpr std::string_view ToString(StrideCategory category) {
  switch (category) {
    case StrideCategory::kSpoofing:
      return "Spoofing";
    case StrideCategory::kTampering:
      return "Tampering";
    case StrideCategory::kRepudiation:
      return "Repudiation";
    case StrideCategory::kInformationDisclosure:
      return "Information Disclosure";
    case StrideCategory::kDenialOfService:
      return "Denial of Service";
    case StrideCategory::kElevationOfPrivilege:
    default:
      return "Elevation of Privilege";
  }
}

/*
  Set of STRIDE categories packed into a bitmask.
*/
class StrideSet {
 public:
  constexpr StrideSet() = default;

  constexpr void Insert(StrideCategory category) {
    bits_ |= Bit(category);
  }

  constexpr bool Contains(StrideCategory category) const {
    return (bits_ & Bit(category)) != 0;
  }

  constexpr bool Empty() const {
    return bits_ == 0;
  }

 private:
  static constexpr std::uint8_t Bit(StrideCategory category) {
    return static_cast<std::uint8_t>(1u << static_cast<std::uint8_t>(category));
  }

  std::uint8_t bits_ = 0;
};

} // namespace refiner::model
