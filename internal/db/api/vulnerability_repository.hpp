#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/vulnerability.hpp"
#include "internal/util/time.hpp"

namespace refiner::db {

/*
  Persistent cache of vulnerability intelligence, keyed by CVE id.

  GUARANTEES:

  - Upsert replaces the whole record, including fetched_at
  - Get never returns a record other than the one last upserted
  - PurgeFetchedBefore removes every record with fetched_at < cutoff

  Freshness (TTL) is decided by the caller from fetched_at.
*/
class VulnerabilityRepository {
 public:
  virtual ~VulnerabilityRepository() = default;

  virtual Result Upsert(const model::VulnerabilityRecord& record) = 0;

  virtual std::optional<model::VulnerabilityRecord> Get(const std::string& cve_id) = 0;

  // Ordered by cve_id.
  virtual std::vector<model::VulnerabilityRecord> List() = 0;

  virtual Result PurgeFetchedBefore(util::TimePoint cutoff) = 0;
};

} // namespace refiner::db
