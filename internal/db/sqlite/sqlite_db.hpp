#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <string>

namespace refiner::db::sqlite {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* statement) const {
    sqlite3_finalize(statement);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

/*
  Connection to the vulnerability cache file.

  Opening creates the file when needed, puts file databases in WAL mode
  so the server and refinectl can share one cache, and brings the schema
  up to kSchemaVersion. ":memory:" opens a private database.

  A path that cannot be opened, or a cache written by a newer schema,
  throws util::InvalidConfig.
*/
class SqliteDB {
 public:
  static constexpr int kSchemaVersion = 1;

  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::seconds(5));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Schema and pragma statements. Throws util::InvalidConfig on failure.
  void Exec(const char* sql);

  // Null when the statement does not compile; see ErrorMessage().
  Statement Prepare(const char* sql) const;

  std::string ErrorMessage() const {
    return sqlite3_errmsg(db_);
  }

 private:
  int  SchemaVersion() const;
  void Migrate();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Holds the connection mutex so a statement, its error message and its
  change count are read by the same caller.
*/
class ConnectionLock {
 public:
  explicit ConnectionLock(const SqliteDB& db) : mutex_(sqlite3_db_mutex(db.Handle())) {
    sqlite3_mutex_enter(mutex_);
  }

  ~ConnectionLock() {
    sqlite3_mutex_leave(mutex_);
  }

  ConnectionLock(const ConnectionLock&)            = delete;
  ConnectionLock& operator=(const ConnectionLock&) = delete;

 private:
  sqlite3_mutex* mutex_;
};

} // namespace refiner::db::sqlite
