#include "memory_vulnerability_repository.hpp"

namespace refiner::db::memory {

Result MemoryVulnerabilityRepository::Upsert(const model::VulnerabilityRecord& record) {
  if (record.cve_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "cve_id is required");
  }

  std::lock_guard lock(mutex_);
  records_[record.cve_id] = record;
  return Result::Ok(1);
}

std::optional<model::VulnerabilityRecord> MemoryVulnerabilityRepository::Get(const std::string& cve_id) {
  std::lock_guard lock(mutex_);
  auto            it = records_.find(cve_id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::VulnerabilityRecord> MemoryVulnerabilityRepository::List() {
  std::lock_guard                         lock(mutex_);
  std::vector<model::VulnerabilityRecord> out;
  out.reserve(records_.size());
  for (const auto& [_, record] : records_) {
    out.push_back(record);
  }
  return out;
}

Result MemoryVulnerabilityRepository::PurgeFetchedBefore(util::TimePoint cutoff) {
  std::lock_guard lock(mutex_);
  const auto      removed = std::erase_if(records_, [cutoff](const auto& entry) { return entry.second.fetched_at < cutoff; });
  return Result::Ok(removed);
}

} // namespace refiner::db::memory
