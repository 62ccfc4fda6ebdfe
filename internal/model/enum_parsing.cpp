#include "internal/model/enum_parsing.hpp"

#include <string>

#include "internal/util/text.hpp"

namespace refiner::model {

namespace {

// "STRIDE_CATEGORY_INFORMATION_DISCLOSURE" -> "information disclosure"
std::string Canonical(std::string_view text, std::string_view enum_prefix) {
  auto normalized = util::NormalizeText(text);
  if (!enum_prefix.empty() && normalized.rfind(enum_prefix, 0) == 0) {
    normalized = normalized.substr(enum_prefix.size());
  }
  return normalized;
}

} // namespace

std::optional<StrideCategory> ParseStrideCategory(std::string_view text) {
  const auto value = Canonical(text, "stride category ");

  if (value == "s" || value == "spoofing") return StrideCategory::kSpoofing;
  if (value == "t" || value == "tampering") return StrideCategory::kTampering;
  if (value == "r" || value == "repudiation") return StrideCategory::kRepudiation;
  if (value == "i" || value == "information disclosure" || value == "info disclosure") return StrideCategory::kInformationDisclosure;
  if (value == "d" || value == "denial of service" || value == "dos") return StrideCategory::kDenialOfService;
  if (value == "e" || value == "elevation of privilege" || value == "privilege escalation") return StrideCategory::kElevationOfPrivilege;

  return std::nullopt;
}

std::optional<ComponentType> ParseComponentType(std::string_view text) {
  const auto value = Canonical(text, "component type ");

  if (value == "external entity" || value == "external entities" || value == "external") return ComponentType::kExternalEntity;
  if (value == "process" || value == "processes") return ComponentType::kProcess;
  if (value == "data store" || value == "data stores" || value == "datastore" || value == "asset" || value == "assets")
    return ComponentType::kDataStore;
  if (value == "data flow" || value == "data flows" || value == "dataflow") return ComponentType::kDataFlow;

  return std::nullopt;
}

std::optional<Industry> ParseIndustry(std::string_view text) {
  const auto value = Canonical(text, "industry ");

  if (value == "generic" || value == "general") return Industry::kGeneric;
  if (value == "finance" || value == "financial" || value == "banking") return Industry::kFinance;
  if (value == "healthcare" || value == "health") return Industry::kHealthcare;
  if (value == "government" || value == "public sector") return Industry::kGovernment;

  return std::nullopt;
}

} // namespace refiner::model
