#include "sqlite_vulnerability_repository.hpp"

#include "internal/util/errors.hpp"

namespace refiner::db::sqlite {

namespace {

constexpr const char* kColumns = "cve_id,published,known_exploited,fetched_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColumnText(sqlite3_stmt* st, int col) {
  const unsigned char* text = sqlite3_column_text(st, col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

model::VulnerabilityRecord ReadRecord(sqlite3_stmt* st) {
  model::VulnerabilityRecord record;
  record.cve_id = ColumnText(st, 0);
  if (sqlite3_column_type(st, 1) != SQLITE_NULL) {
    record.published_date = util::ParseDate(ColumnText(st, 1));
  }
  record.in_known_exploited_catalog = sqlite3_column_int(st, 2) != 0;
  record.fetched_at                 = util::FromUnixMillis(static_cast<std::uint64_t>(sqlite3_column_int64(st, 3)));
  return record;
}

ErrorCode ToErrorCode(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

} // namespace

SqliteVulnerabilityRepository::SqliteVulnerabilityRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (!db_) {
    throw util::InvalidConfig("sqlite vulnerability cache requires an open database");
  }
}

Result SqliteVulnerabilityRepository::Failure(int rc) const {
  return Result::Err(ToErrorCode(rc), db_->ErrorMessage());
}

Result SqliteVulnerabilityRepository::Upsert(const model::VulnerabilityRecord& record) {
  if (record.cve_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "cve_id is required");
  }

  ConnectionLock lock(*db_);

  auto st = db_->Prepare(
      "INSERT INTO vulnerability_cache(cve_id,published,known_exploited,fetched_at_ms) VALUES(?,?,?,?) "
      "ON CONFLICT(cve_id) DO UPDATE SET "
      "published=excluded.published, known_exploited=excluded.known_exploited, fetched_at_ms=excluded.fetched_at_ms;");
  if (!st) return Failure(sqlite3_errcode(db_->Handle()));

  BindText(st.get(), 1, record.cve_id);
  if (record.published_date) {
    BindText(st.get(), 2, util::FormatDate(*record.published_date));
  } else {
    sqlite3_bind_null(st.get(), 2);
  }
  sqlite3_bind_int(st.get(), 3, record.in_known_exploited_catalog ? 1 : 0);
  sqlite3_bind_int64(st.get(), 4, static_cast<sqlite3_int64>(util::ToUnixMillis(record.fetched_at)));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Failure(rc);
  return Result::Ok(static_cast<std::size_t>(sqlite3_changes(db_->Handle())));
}

std::optional<model::VulnerabilityRecord> SqliteVulnerabilityRepository::Get(const std::string& cve_id) {
  auto st = db_->Prepare(("SELECT " + std::string(kColumns) + " FROM vulnerability_cache WHERE cve_id=?;").c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, cve_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRecord(st.get());
}

std::vector<model::VulnerabilityRecord> SqliteVulnerabilityRepository::List() {
  std::vector<model::VulnerabilityRecord> out;

  auto st = db_->Prepare(("SELECT " + std::string(kColumns) + " FROM vulnerability_cache ORDER BY cve_id;").c_str());
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRecord(st.get()));
  }
  return out;
}

Result SqliteVulnerabilityRepository::PurgeFetchedBefore(util::TimePoint cutoff) {
  ConnectionLock lock(*db_);

  auto st = db_->Prepare("DELETE FROM vulnerability_cache WHERE fetched_at_ms < ?;");
  if (!st) return Failure(sqlite3_errcode(db_->Handle()));

  sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(util::ToUnixMillis(cutoff)));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Failure(rc);
  return Result::Ok(static_cast<std::size_t>(sqlite3_changes(db_->Handle())));
}

} // namespace refiner::db::sqlite
