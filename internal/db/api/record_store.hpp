#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"

namespace backoffice::db {

/*
  Record store abstraction.

  Models a spreadsheet-like backend: named collections of rows whose cells
  are all strings, keyed by one primary key column.

  GUARANTEES:

  - Scan returns rows in insertion order
  - AppendRows writes every row or none (single call)
  - UpdateByKey patches a single row and reports before/after images
  - There are NO multi-call transactions; callers serialize mutations
    themselves (see lock::MutationLock)

  Reads report backend failures by throwing std::runtime_error, writes by
  returning a non-OK Result.
*/

using Row = std::map<std::string, std::string>;

struct UpdateOutcome {
  Result result;
  Row    before;
  Row    after;
};

class RecordStore {
 public:
  virtual ~RecordStore() = default;

  virtual std::vector<Row> Scan(const std::string& collection) = 0;

  virtual std::optional<Row> FindByKey(const std::string& collection, const std::string& key_column, const std::string& key_value) = 0;

  virtual Result AppendRows(const std::string& collection, const std::vector<Row>& rows) = 0;

  // Columns absent from the patch keep their value. Patching the key column
  // is rejected.
  virtual UpdateOutcome UpdateByKey(const std::string& collection, const std::string& key_column, const std::string& key_value, const Row& patch) = 0;
};

// Convenience lookup; empty when the column is absent.
inline const std::string& Cell(const Row& row, const std::string& column) {
  static const std::string kEmpty;
  auto                     it = row.find(column);
  return it == row.end() ? kEmpty : it->second;
}

} // namespace backoffice::db
