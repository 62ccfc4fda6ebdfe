#include "static_vulnerability_feed.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "refiner/v1.hpp"

namespace refiner::vuln {

StaticVulnerabilityFeed::StaticVulnerabilityFeed(std::vector<model::VulnerabilityRecord> records) {
  for (auto& record : records) {
    auto id      = record.cve_id;
    records_[id] = std::move(record);
  }
}

FeedBatch StaticVulnerabilityFeed::Fetch(const std::vector<std::string>& cve_ids) {
  FeedBatch batch;
  for (const auto& id : cve_ids) {
    auto it = records_.find(id);
    if (it != records_.end()) batch.records.push_back(it->second);
  }
  return batch;
}

model::VulnerabilityRecord FromProto(const refiner::v1::VulnerabilityRecord& record) {
  // cited ids are upper-cased on ingest; keys here must match them
  auto cve_id = util::ToUpper(util::Trim(record.cve_id()));
  if (cve_id.empty()) {
    throw util::InvalidConfig("vulnerability record without cve_id");
  }

  model::VulnerabilityRecord out;
  out.cve_id                     = std::move(cve_id);
  out.in_known_exploited_catalog = record.in_known_exploited_catalog();

  if (!record.published_date().empty()) {
    out.published_date = util::ParseDate(record.published_date());
    if (!out.published_date) {
      throw util::InvalidConfig("invalid published_date for " + record.cve_id() + ": " + record.published_date());
    }
  }

  return out;
}

} // namespace refiner::vuln
