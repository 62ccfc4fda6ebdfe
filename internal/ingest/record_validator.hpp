#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/component.hpp"
#include "internal/model/control.hpp"
#include "internal/model/threat.hpp"

namespace refiner::v1 {
class RawThreat;
class RawComponent;
class RawControl;
class RefineThreatsRequest;
} // namespace refiner::v1

namespace refiner::ingest {

struct RejectedRecord {
  std::string kind; // threat | component | control
  std::string id;
  std::size_t position = 0; // 1-based position in its input list
  std::string reason;
};

struct IngestedBatch {
  std::vector<model::Threat>    threats;
  std::vector<model::Component> components;
  std::vector<model::Control>   controls;
  std::vector<RejectedRecord>   rejected;
};

/*
  Turns loosely typed upstream records into strict model types.

  The Validate* calls throw util::InvalidInput for a non-conforming
  record; Ingest catches those per record, quarantines the record and
  keeps going, so one bad record never fails the batch.

  References are split into cited CVEs (CVE-YYYY-NNNN..., upper-cased,
  order-preserving, duplicates dropped) and other references.
*/
class RecordValidator {
 public:
  // `position` is 1-based; a missing id becomes "T-<position>".
  model::Threat ValidateThreat(const refiner::v1::RawThreat& raw, std::size_t position) const;

  model::Component ValidateComponent(const refiner::v1::RawComponent& raw) const;

  model::Control ValidateControl(const refiner::v1::RawControl& raw) const;

  IngestedBatch Ingest(const refiner::v1::RefineThreatsRequest& request) const;
};

bool IsCveId(std::string_view text);

// Impact (Critical/High/Medium/Low) x likelihood (High/Medium/Low) mapped onto 0..10.
// Throws util::InvalidInput for an unknown label.
double ScoreFromLabels(std::string_view impact, std::string_view likelihood);

} // namespace refiner::ingest
