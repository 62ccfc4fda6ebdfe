#include "quality_gate.hpp"

#include <array>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/refine/transitions.hpp"
#include "internal/util/text.hpp"

namespace refiner::refine {

namespace {

constexpr std::array<std::string_view, 5> kGenericPhrases = {
    "an attacker could",
    "unauthorized access",
    "malicious user might",
    "potential security risk",
    "vulnerability may exist",
};

constexpr std::string_view kPlaceholderMitigation = "implement security measures";

} // namespace

QualityGate::QualityGate(config::QualityOptions options) : options_(options) {
}

std::optional<std::string> QualityGate::Evaluate(const model::Threat& threat) const {
  const auto description = util::ToLower(threat.description);
  if (description.size() < options_.min_description_length) {
    return "description shorter than " + std::to_string(options_.min_description_length) + " characters";
  }

  std::size_t generic = 0;
  for (auto phrase : kGenericPhrases) {
    if (description.find(phrase) != std::string::npos) ++generic;
  }
  if (generic > options_.max_generic_phrases) {
    return "description uses " + std::to_string(generic) + " generic phrases";
  }

  const auto mitigation = util::ToLower(threat.mitigation_suggestion);
  if (mitigation.size() < options_.min_mitigation_length) {
    return "mitigation shorter than " + std::to_string(options_.min_mitigation_length) + " characters";
  }
  if (mitigation.find(kPlaceholderMitigation) != std::string::npos) {
    return "mitigation is a placeholder";
  }

  return std::nullopt;
}

bool QualityGate::Apply(model::Threat& threat) const {
  if (!options_.enabled || !threat.IsActive()) return false;

  auto failure = Evaluate(threat);
  if (!failure) return false;

  REFINER_LOG_DEBUG("low quality threat suppressed",
                    {observability::StringField("threat_id", threat.id), observability::StringField("reason", *failure)});
  Suppress(threat, "low_quality");
  return true;
}

} // namespace refiner::refine
