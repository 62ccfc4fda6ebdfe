#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/vulnerability_repository.hpp"

namespace refiner::db::memory {

class MemoryVulnerabilityRepository final : public db::VulnerabilityRepository {
 public:
  Result Upsert(const model::VulnerabilityRecord& record) override;

  std::optional<model::VulnerabilityRecord> Get(const std::string& cve_id) override;

  std::vector<model::VulnerabilityRecord> List() override;

  Result PurgeFetchedBefore(util::TimePoint cutoff) override;

 private:
  std::mutex                                         mutex_;
  std::map<std::string, model::VulnerabilityRecord> records_;
};

} // namespace refiner::db::memory
