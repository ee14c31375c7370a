#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/record_store.hpp"

namespace backoffice::db::memory {

/*
  In-process record store.

  Rows live in insertion order per collection with a key index beside them.
  Supports fault injection so tests can make the Nth write to a collection
  fail and observe how the pipeline reports a half-finished commit.
*/
class MemoryRecordStore final : public db::RecordStore {
public:
  MemoryRecordStore();

  std::vector<Row> Scan(const std::string& collection) override;
  std::optional<Row> FindByKey(const std::string& collection, const std::string& key_column, const std::string& key_value) override;
  Result AppendRows(const std::string& collection, const std::vector<Row>& rows) override;
  UpdateOutcome UpdateByKey(const std::string& collection, const std::string& key_column, const std::string& key_value, const Row& patch) override;

  // The next `count` writes (appends or updates) to `collection` fail with
  // `code` and leave the collection untouched.
  void InjectWriteFailure(const std::string& collection, ErrorCode code, int count = 1);

  // Reads of `collection` throw until cleared.
  void InjectReadFailure(const std::string& collection, bool enabled);

  // Successful write calls across all collections.
  std::uint64_t WriteCount() const;

private:
  struct Table {
    std::vector<Row> rows;
    std::unordered_map<std::string, std::size_t> index;
  };

  struct Fault {
    ErrorCode code = ErrorCode::OK;
    int remaining = 0;
  };

  Result TakeFault(const std::string& collection);
  void CheckReadable(const std::string& collection) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Table> tables_;
  std::unordered_map<std::string, Fault> write_faults_;
  std::unordered_map<std::string, bool> read_faults_;
  std::uint64_t writes_ = 0;
};

} // namespace backoffice::db::memory
