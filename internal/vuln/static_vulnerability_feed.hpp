#pragma once

#include <unordered_map>

#include "internal/vuln/vulnerability_feed.hpp"

namespace refiner::v1 {
class VulnerabilityRecord;
}

namespace refiner::vuln {

/*
  In-process feed backed by a fixed record set.
  Used for offline runs and tests.
*/
class StaticVulnerabilityFeed final : public VulnerabilityFeed {
 public:
  explicit StaticVulnerabilityFeed(std::vector<model::VulnerabilityRecord> records);

  std::string_view Name() const override {
    return "static";
  }

  FeedBatch Fetch(const std::vector<std::string>& cve_ids) override;

 private:
  std::unordered_map<std::string, model::VulnerabilityRecord> records_;
};

// Throws util::InvalidConfig when the id is empty or the date does not parse.
model::VulnerabilityRecord FromProto(const refiner::v1::VulnerabilityRecord& record);

} // namespace refiner::vuln
