#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/record_store.hpp"
#include "internal/db/api/result.hpp"

namespace backoffice::db::schema {

/*
  Registry of every collection the back office persists.

  Both store adapters validate against it: unknown collections are
  NotFound, unknown columns and missing keys are InvalidArgument. The SQLite
  adapter also creates its tables from it.
*/

inline constexpr const char* kItems          = "items";
inline constexpr const char* kStockBatches   = "stock_batches";
inline constexpr const char* kCustomers      = "customers";
inline constexpr const char* kSuppliers      = "suppliers";
inline constexpr const char* kSales          = "sales";
inline constexpr const char* kSaleItems      = "sale_items";
inline constexpr const char* kSaleStatusLog  = "sale_status_log";
inline constexpr const char* kSaleReturns    = "sale_returns";
inline constexpr const char* kQuotations     = "quotations";
inline constexpr const char* kQuotationItems = "quotation_items";
inline constexpr const char* kPurchases      = "purchases";
inline constexpr const char* kLedger         = "ledger";
inline constexpr const char* kAuditLog       = "audit_log";

struct CollectionSchema {
  std::string              name;
  std::string              key_column;
  std::vector<std::string> columns;
};

const std::vector<CollectionSchema>& Collections();

// nullptr when the collection is not registered.
const CollectionSchema* Find(std::string_view name);

bool HasColumn(const CollectionSchema& schema, std::string_view column);

// Checks that every cell names a registered column and that the key cell is
// present and non-empty.
Result ValidateRow(const CollectionSchema& schema, const Row& row);

// Checks an update patch: registered columns only, key column untouched.
Result ValidatePatch(const CollectionSchema& schema, const Row& patch);

// Checks the collection exists and key_column is its key.
Result ValidateKeyLookup(std::string_view collection, std::string_view key_column, const CollectionSchema** out);

} // namespace backoffice::db::schema
