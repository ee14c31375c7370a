#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/record_store.hpp"
#include "sqlite_db.hpp"

namespace backoffice::db::sqlite {

/*
  SQLite-backed record store.

  One table per registered collection, every column TEXT, the key column
  the PRIMARY KEY. Identifiers are taken from the schema registry only and
  quoted, never from caller input. Each call is its own BEGIN IMMEDIATE
  transaction; rowid order is insertion order.
*/
class SqliteRecordStore final : public db::RecordStore {
public:
  explicit SqliteRecordStore(std::shared_ptr<SqliteDB> db);

  // Creates missing tables. Idempotent.
  void BootstrapSchema();

  std::vector<Row> Scan(const std::string& collection) override;
  std::optional<Row> FindByKey(const std::string& collection, const std::string& key_column, const std::string& key_value) override;
  Result AppendRows(const std::string& collection, const std::vector<Row>& rows) override;
  UpdateOutcome UpdateByKey(const std::string& collection, const std::string& key_column, const std::string& key_value, const Row& patch) override;

private:
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;

  // one connection: BEGIN IMMEDIATE must not nest across threads
  std::mutex mutex_;
};

} // namespace backoffice::db::sqlite
