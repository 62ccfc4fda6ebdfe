#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace refiner::db::sqlite {

namespace {

constexpr const char* kCreateSchema =
    "CREATE TABLE IF NOT EXISTS vulnerability_cache("
    " cve_id TEXT PRIMARY KEY,"
    " published TEXT NULL,"
    " known_exploited INTEGER NOT NULL DEFAULT 0,"
    " fetched_at_ms INTEGER NOT NULL);"
    "CREATE INDEX IF NOT EXISTS vulnerability_cache_fetched_at ON vulnerability_cache(fetched_at_ms);";

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::InvalidConfig("vulnerability cache " + path_ + ": " + msg);
  }

  try {
    // lock waits matter when refinectl and the server share one file
    sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
    if (path_ != ":memory:") {
      Exec("PRAGMA journal_mode=WAL;");
      Exec("PRAGMA synchronous=NORMAL;");
    }
    Migrate();
  } catch (const util::InvalidConfig&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const char* sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw util::InvalidConfig("vulnerability cache " + path_ + ": " + msg);
  }
}

Statement SqliteDB::Prepare(const char* sql) const {
  sqlite3_stmt* statement = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &statement, nullptr) != SQLITE_OK) {
    sqlite3_finalize(statement);
    return nullptr;
  }
  return Statement(statement);
}

int SqliteDB::SchemaVersion() const {
  auto statement = Prepare("PRAGMA user_version;");
  if (!statement || sqlite3_step(statement.get()) != SQLITE_ROW) {
    throw util::InvalidConfig("vulnerability cache " + path_ + ": cannot read schema version: " + ErrorMessage());
  }
  return sqlite3_column_int(statement.get(), 0);
}

void SqliteDB::Migrate() {
  const int version = SchemaVersion();
  if (version == kSchemaVersion) return;
  if (version > kSchemaVersion) {
    throw util::InvalidConfig("vulnerability cache " + path_ + " has schema version " + std::to_string(version) +
                              "; this build reads up to " + std::to_string(kSchemaVersion));
  }

  Exec("BEGIN IMMEDIATE;");
  try {
    Exec(kCreateSchema);
    Exec(("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";").c_str());
    Exec("COMMIT;");
  } catch (const util::InvalidConfig&) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

} // namespace refiner::db::sqlite
