#include "memory_record_store.hpp"

#include <stdexcept>
#include <unordered_set>

#include "internal/db/schema/collections.hpp"

namespace backoffice::db::memory {

MemoryRecordStore::MemoryRecordStore() {
  for (const auto& schema : schema::Collections()) {
    tables_.emplace(schema.name, Table{});
  }
}

void MemoryRecordStore::CheckReadable(const std::string& collection) const {
  if (!schema::Find(collection)) {
    throw std::runtime_error("unknown collection " + collection);
  }
  auto fault = read_faults_.find(collection);
  if (fault != read_faults_.end() && fault->second) {
    throw std::runtime_error("injected read failure on " + collection);
  }
}

Result MemoryRecordStore::TakeFault(const std::string& collection) {
  auto it = write_faults_.find(collection);
  if (it == write_faults_.end() || it->second.remaining <= 0) return Result::Ok();
  --it->second.remaining;
  return Result::Err(it->second.code, "injected write failure on " + collection);
}

std::vector<Row> MemoryRecordStore::Scan(const std::string& collection) {
  std::lock_guard lock(mutex_);
  CheckReadable(collection);
  return tables_.at(collection).rows;
}

std::optional<Row> MemoryRecordStore::FindByKey(const std::string& collection, const std::string& key_column, const std::string& key_value) {
  std::lock_guard lock(mutex_);
  CheckReadable(collection);

  const schema::CollectionSchema* schema = nullptr;
  if (auto r = schema::ValidateKeyLookup(collection, key_column, &schema); !r) {
    throw std::runtime_error(r.message);
  }

  const auto& table = tables_.at(collection);
  auto        it    = table.index.find(key_value);
  if (it == table.index.end()) return std::nullopt;
  return table.rows[it->second];
}

Result MemoryRecordStore::AppendRows(const std::string& collection, const std::vector<Row>& rows) {
  std::lock_guard lock(mutex_);

  const auto* schema = schema::Find(collection);
  if (!schema) return Result::Err(ErrorCode::NotFound, "unknown collection " + collection);
  if (rows.empty()) return Result::Ok();

  // validate the whole batch before touching the table
  auto&                           table = tables_.at(collection);
  std::unordered_set<std::string> batch_keys;
  for (const auto& row : rows) {
    if (auto r = schema::ValidateRow(*schema, row); !r) return r;
    const auto& key = Cell(row, schema->key_column);
    if (table.index.contains(key) || !batch_keys.insert(key).second) {
      return Result::Err(ErrorCode::AlreadyExists, collection + " key " + key + " already exists");
    }
  }

  if (auto fault = TakeFault(collection); !fault) return fault;

  for (const auto& row : rows) {
    Row stored;
    for (const auto& column : schema->columns) {
      stored[column] = Cell(row, column);
    }
    table.index.emplace(Cell(row, schema->key_column), table.rows.size());
    table.rows.push_back(std::move(stored));
  }
  ++writes_;
  return Result::Ok();
}

UpdateOutcome MemoryRecordStore::UpdateByKey(const std::string& collection, const std::string& key_column, const std::string& key_value, const Row& patch) {
  std::lock_guard lock(mutex_);

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

  auto& table = tables_.at(collection);
  auto  it    = table.index.find(key_value);
  if (it == table.index.end()) {
    outcome.result = Result::Err(ErrorCode::NotFound, collection + " key " + key_value + " not found");
    return outcome;
  }

  if (auto fault = TakeFault(collection); !fault) {
    outcome.result = fault;
    return outcome;
  }

  auto& row      = table.rows[it->second];
  outcome.before = row;
  for (const auto& [column, value] : patch) {
    row[column] = value;
  }
  outcome.after = row;
  ++writes_;
  return outcome;
}

void MemoryRecordStore::InjectWriteFailure(const std::string& collection, ErrorCode code, int count) {
  std::lock_guard lock(mutex_);
  write_faults_[collection] = Fault{code, count};
}

void MemoryRecordStore::InjectReadFailure(const std::string& collection, bool enabled) {
  std::lock_guard lock(mutex_);
  read_faults_[collection] = enabled;
}

std::uint64_t MemoryRecordStore::WriteCount() const {
  std::lock_guard lock(mutex_);
  return writes_;
}

} // namespace backoffice::db::memory
