#pragma once

#include <string>
#include <string_view>

#include "internal/model/threat.hpp"
#include "internal/util/errors.hpp"

namespace refiner::refine {

/*
  The only places a threat's status changes. Suppressed and merged are
  terminal; leaving them is a pipeline bug and throws InvariantViolation.
*/

inline void RequireActive(const model::Threat& threat, std::string_view stage) {
  if (!threat.IsActive()) {
    throw util::InvariantViolation(std::string(stage) + ": threat " + threat.id + " is " + std::string(model::ToString(threat.status)) +
                                   "; only active threats may enter this stage");
  }
}

inline void Suppress(model::Threat& threat, std::string reason) {
  if (!model::CanTransition(threat.status, model::ThreatStatus::kSuppressed) || threat.status == model::ThreatStatus::kSuppressed) {
    throw util::InvariantViolation("suppress: threat " + threat.id + " is already " + std::string(model::ToString(threat.status)));
  }
  threat.status            = model::ThreatStatus::kSuppressed;
  threat.suppressed_reason = std::move(reason);
}

inline void MarkMerged(model::Threat& threat, const std::string& representative_id) {
  if (!model::CanTransition(threat.status, model::ThreatStatus::kMerged) || threat.status == model::ThreatStatus::kMerged) {
    throw util::InvariantViolation("merge: threat " + threat.id + " is already " + std::string(model::ToString(threat.status)));
  }
  threat.status      = model::ThreatStatus::kMerged;
  threat.merged_into = representative_id;
}

} // namespace refiner::refine
