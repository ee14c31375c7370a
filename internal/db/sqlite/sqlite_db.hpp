#pragma once

#include <sqlite3.h>

#include <chrono>
#include <string>

namespace backoffice::db::sqlite {

struct SqliteOptions {
  std::string               path;
  bool                      wal_mode     = true;
  std::chrono::milliseconds busy_timeout = std::chrono::seconds(5);
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  // Execute a SQL string (used for pragmas/schema bootstrap)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  // Configure PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

} // namespace backoffice::db::sqlite
