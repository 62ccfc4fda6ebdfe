#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/vulnerability.hpp"

namespace refiner::vuln {

struct FetchFailure {
  std::string cve_id;
  std::string error;
};

struct FeedBatch {
  std::vector<model::VulnerabilityRecord> records;
  // Ids the feed could not look up. Their relevance is unknown, not "absent".
  std::vector<FetchFailure> failures;
};

/*
  Pull-based source of vulnerability intelligence.

  Fetch returns records for the ids the feed knows; unknown ids are
  omitted. A lookup that fails for a single id is reported in
  FeedBatch::failures and the rest of the batch is still returned. A
  feed that cannot serve the batch at all throws util::FeedUnavailable.
  Implementations make a single attempt; retry belongs to the catalog.
*/
class VulnerabilityFeed {
 public:
  virtual ~VulnerabilityFeed() = default;

  virtual std::string_view Name() const = 0;

  virtual FeedBatch Fetch(const std::vector<std::string>& cve_ids) = 0;
};

} // namespace refiner::vuln
