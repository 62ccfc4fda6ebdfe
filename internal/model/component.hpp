#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace refiner::model {

enum class ComponentType : std::uint8_t {
  kExternalEntity = 0,
  kProcess        = 1,
  kDataStore      = 2,
  kDataFlow       = 3,
};

constexpr std::string_view ToString(ComponentType type) {
  switch (type) {
    case ComponentType::kExternalEntity:
      return "External Entity";
    case ComponentType::kProcess:
      return "Process";
    case ComponentType::kDataStore:
      return "Data Store";
    case ComponentType::kDataFlow:
    default:
      return "Data Flow";
  }
}

/*
  Inventory entry. Read-only for the duration of a run.
*/
struct Component {
  std::string   canonical_name;
  ComponentType type = ComponentType::kProcess;
  std::string   description;

  // PII, PHI, PCI, Confidential, ... (empty when unclassified)
  std::string data_classification;
};

} // namespace refiner::model
