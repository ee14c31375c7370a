#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace backoffice::db::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_.Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      BACKOFFICE_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_.Path()), observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_.Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace backoffice::db::sqlite
