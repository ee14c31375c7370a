#include "sqlite_record_store.hpp"

#include <stdexcept>

#include "internal/db/schema/collections.hpp"
#include "internal/observability/logging.hpp"
#include "sqlite_tx.hpp"

namespace backoffice::db::sqlite {

using backoffice::db::ErrorCode;
using backoffice::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

std::string Quote(const std::string& identifier) {
  return "\"" + identifier + "\"";
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string SelectColumns(const schema::CollectionSchema& schema) {
  std::string sql;
  for (std::size_t i = 0; i < schema.columns.size(); ++i) {
    if (i) sql += ",";
    sql += Quote(schema.columns[i]);
  }
  return sql;
}

Row ReadRow(sqlite3_stmt* st, const schema::CollectionSchema& schema) {
  Row row;
  for (std::size_t i = 0; i < schema.columns.size(); ++i) {
    row[schema.columns[i]] = ColText(st, static_cast<int>(i));
  }
  return row;
}

const schema::CollectionSchema& RequireCollection(const std::string& collection) {
  const auto* schema = schema::Find(collection);
  if (!schema) throw std::runtime_error("unknown collection " + collection);
  return *schema;
}

} // namespace

SqliteRecordStore::SqliteRecordStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  sqlite3_extended_result_codes(db_->Handle(), 1);
}

Result SqliteRecordStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
    return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  }

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void SqliteRecordStore::BootstrapSchema() {
  std::lock_guard lock(mutex_);
  SqliteTransaction tx(*db_);
  for (const auto& schema : schema::Collections()) {
    std::string sql = "CREATE TABLE IF NOT EXISTS " + Quote(schema.name) + " (";
    for (std::size_t i = 0; i < schema.columns.size(); ++i) {
      const auto& column = schema.columns[i];
      if (i) sql += ", ";
      sql += Quote(column) + " TEXT";
      sql += column == schema.key_column ? " PRIMARY KEY" : " NOT NULL DEFAULT ''";
    }
    sql += ");";
    db_->Exec(sql);
  }
  tx.Commit();
  BACKOFFICE_LOG_INFO("sqlite schema ready", {observability::StringField("path", db_->Path()),
                                              observability::IntField("collections", static_cast<std::int64_t>(schema::Collections().size()))});
}

std::vector<Row> SqliteRecordStore::Scan(const std::string& collection) {
  const auto& schema = RequireCollection(collection);

  std::lock_guard lock(mutex_);
  Statement       st(db_->Prepare("SELECT " + SelectColumns(schema) + " FROM " + Quote(schema.name) + " ORDER BY rowid;"));

  std::vector<Row> rows;
  int              rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    rows.push_back(ReadRow(st.get(), schema));
  }
  if (auto r = Translate(db_->Handle(), rc); !r) {
    throw std::runtime_error("scan " + collection + ": " + r.message);
  }
  return rows;
}

std::optional<Row> SqliteRecordStore::FindByKey(const std::string& collection, const std::string& key_column, const std::string& key_value) {
  const schema::CollectionSchema* schema = nullptr;
  if (auto r = schema::ValidateKeyLookup(collection, key_column, &schema); !r) {
    throw std::runtime_error(r.message);
  }

  std::lock_guard lock(mutex_);
  Statement       st(db_->Prepare("SELECT " + SelectColumns(*schema) + " FROM " + Quote(schema->name) + " WHERE " + Quote(schema->key_column) + "=?;"));
  BindText(st.get(), 1, key_value);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return ReadRow(st.get(), *schema);
  if (auto r = Translate(db_->Handle(), rc); !r) {
    throw std::runtime_error("find " + collection + ": " + r.message);
  }
  return std::nullopt;
}

Result SqliteRecordStore::AppendRows(const std::string& collection, const std::vector<Row>& rows) {
  const auto* schema = schema::Find(collection);
  if (!schema) return Result::Err(ErrorCode::NotFound, "unknown collection " + collection);
  for (const auto& row : rows) {
    if (auto r = schema::ValidateRow(*schema, row); !r) return r;
  }
  if (rows.empty()) return Result::Ok();

  std::string placeholders;
  for (std::size_t i = 0; i < schema->columns.size(); ++i) {
    placeholders += i ? ",?" : "?";
  }
  const std::string sql = "INSERT INTO " + Quote(schema->name) + "(" + SelectColumns(*schema) + ") VALUES(" + placeholders + ");";

  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(*db_);
    Statement         st(db_->Prepare(sql));
    for (const auto& row : rows) {
      sqlite3_reset(st.get());
      sqlite3_clear_bindings(st.get());
      for (std::size_t i = 0; i < schema->columns.size(); ++i) {
        BindText(st.get(), static_cast<int>(i) + 1, Cell(row, schema->columns[i]));
      }
      int rc = sqlite3_step(st.get());
      if (rc != SQLITE_DONE) return Translate(db_->Handle(), rc);
    }
    st.reset();
    tx.Commit();
  } catch (const std::runtime_error& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
  return Result::Ok();
}

UpdateOutcome SqliteRecordStore::UpdateByKey(const std::string& collection, const std::string& key_column, const std::string& key_value, const Row& patch) {
  UpdateOutcome                   outcome;
  const schema::CollectionSchema* schema = nullptr;
  if (auto r = schema::ValidateKeyLookup(collection, key_column, &schema); !r) {
    outcome.result = r;
    return outcome;
  }
  if (auto r = schema::ValidatePatch(*schema, patch); !r) {
    outcome.result = r;
    return outcome;
  }

  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(*db_);

    Statement select(db_->Prepare("SELECT " + SelectColumns(*schema) + " FROM " + Quote(schema->name) + " WHERE " + Quote(schema->key_column) + "=?;"));
    BindText(select.get(), 1, key_value);
    int rc = sqlite3_step(select.get());
    if (rc != SQLITE_ROW) {
      outcome.result = rc == SQLITE_DONE ? Result::Err(ErrorCode::NotFound, collection + " key " + key_value + " not found") : Translate(db_->Handle(), rc);
      return outcome;
    }
    outcome.before = ReadRow(select.get(), *schema);
    select.reset();

    outcome.after = outcome.before;
    for (const auto& [column, value] : patch) {
      outcome.after[column] = value;
    }

    if (!patch.empty()) {
      std::string sql = "UPDATE " + Quote(schema->name) + " SET ";
      bool        first = true;
      for (const auto& [column, value] : patch) {
        if (!first) sql += ",";
        sql += Quote(column) + "=?";
        first = false;
      }
      sql += " WHERE " + Quote(schema->key_column) + "=?;";

      Statement update(db_->Prepare(sql));
      int       idx = 1;
      for (const auto& [column, value] : patch) {
        BindText(update.get(), idx++, value);
      }
      BindText(update.get(), idx, key_value);
      rc = sqlite3_step(update.get());
      if (rc != SQLITE_DONE) {
        outcome.result = Translate(db_->Handle(), rc);
        return outcome;
      }
    }
    tx.Commit();
  } catch (const std::runtime_error& e) {
    outcome.result = Result::Err(ErrorCode::InternalError, e.what());
  }
  return outcome;
}

} // namespace backoffice::db::sqlite
