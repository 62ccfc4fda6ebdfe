#pragma once

#include <memory>

#include "internal/db/api/vulnerability_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace refiner::db::sqlite {

/*
  SQLite-backed vulnerability cache.

  Table layout (created by SqliteDB):
    vulnerability_cache(cve_id TEXT PRIMARY KEY,
                        published TEXT NULL,      -- YYYY-MM-DD
                        known_exploited INTEGER,
                        fetched_at_ms INTEGER)
*/
class SqliteVulnerabilityRepository final : public db::VulnerabilityRepository {
 public:
  explicit SqliteVulnerabilityRepository(std::shared_ptr<SqliteDB> db);

  Result Upsert(const model::VulnerabilityRecord& record) override;

  std::optional<model::VulnerabilityRecord> Get(const std::string& cve_id) override;

  std::vector<model::VulnerabilityRecord> List() override;

  Result PurgeFetchedBefore(util::TimePoint cutoff) override;

 private:
  Result Failure(int rc) const;

  std::shared_ptr<SqliteDB> db_;
};

} // namespace refiner::db::sqlite
