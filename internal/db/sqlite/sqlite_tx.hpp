#pragma once

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace backoffice::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - a batched append either lands completely or not at all
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_.Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  SqliteDB& db_;
  bool committed_ = false;
};

} // namespace backoffice::db::sqlite
