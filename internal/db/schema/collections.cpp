#include "collections.hpp"

#include <algorithm>

namespace backoffice::db::schema {

const std::vector<CollectionSchema>& Collections() {
  static const std::vector<CollectionSchema> kCollections = {
      {kItems, "item_id", {"item_id", "name", "category", "unit_price", "last_cost", "reorder_level", "status", "created_at"}},
      {kStockBatches,
       "batch_id",
       {"batch_id", "item_id", "quantity_received", "quantity_remaining", "unit_cost", "received_at", "received_at_ms", "source",
        "reference_id"}},
      {kCustomers,
       "customer_id",
       {"customer_id", "name", "phone", "email", "credit_limit", "current_balance", "total_purchases", "last_purchase_date", "status",
        "created_at"}},
      {kSuppliers, "supplier_id", {"supplier_id", "name", "phone", "email", "current_balance", "status", "created_at"}},
      {kSales,
       "transaction_id",
       {"transaction_id", "date_time", "date_time_ms", "type", "customer_id", "payment_mode", "status", "subtotal", "delivery_charge",
        "discount", "grand_total", "total_cost", "created_by", "converted_from", "notes"}},
      {kSaleItems,
       "line_id",
       {"line_id", "transaction_id", "line_no", "item_id", "qty", "unit_price", "line_total", "cost_of_goods_sold", "batch_breakdown"}},
      {kSaleStatusLog, "event_id", {"event_id", "transaction_id", "from_status", "to_status", "reason", "changed_by", "changed_at"}},
      {kSaleReturns,
       "return_id",
       {"return_id", "transaction_id", "line_id", "item_id", "qty", "refund_amount", "cost_restored", "batch_breakdown", "reason",
        "created_by", "created_at"}},
      {kQuotations,
       "transaction_id",
       {"transaction_id", "date_time", "type", "customer_id", "status", "subtotal", "delivery_charge", "discount", "grand_total",
        "valid_until", "valid_until_ms", "converted_sale_id", "created_by", "notes"}},
      {kQuotationItems, "line_id", {"line_id", "transaction_id", "line_no", "item_id", "qty", "unit_price", "line_total"}},
      {kPurchases,
       "purchase_id",
       {"purchase_id", "supplier_id", "item_id", "qty", "unit_cost", "total_cost", "batch_id", "payment_mode", "created_by", "created_at"}},
      {kLedger, "entry_id", {"entry_id", "date_time", "account", "reference_id", "description", "debit", "credit", "created_by"}},
      {kAuditLog, "audit_id", {"audit_id", "at", "user", "module", "action", "details", "before", "after"}},
  };
  return kCollections;
}

const CollectionSchema* Find(std::string_view name) {
  for (const auto& schema : Collections()) {
    if (schema.name == name) return &schema;
  }
  return nullptr;
}

bool HasColumn(const CollectionSchema& schema, std::string_view column) {
  return std::find(schema.columns.begin(), schema.columns.end(), column) != schema.columns.end();
}

Result ValidateRow(const CollectionSchema& schema, const Row& row) {
  for (const auto& [column, value] : row) {
    if (!HasColumn(schema, column)) {
      return Result::Err(ErrorCode::InvalidArgument, "unknown column " + schema.name + "." + column);
    }
  }
  if (Cell(row, schema.key_column).empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "missing key " + schema.name + "." + schema.key_column);
  }
  return Result::Ok();
}

Result ValidatePatch(const CollectionSchema& schema, const Row& patch) {
  for (const auto& [column, value] : patch) {
    if (!HasColumn(schema, column)) {
      return Result::Err(ErrorCode::InvalidArgument, "unknown column " + schema.name + "." + column);
    }
    if (column == schema.key_column) {
      return Result::Err(ErrorCode::InvalidArgument, "key column " + schema.name + "." + column + " is immutable");
    }
  }
  return Result::Ok();
}

Result ValidateKeyLookup(std::string_view collection, std::string_view key_column, const CollectionSchema** out) {
  const auto* schema = Find(collection);
  if (!schema) {
    return Result::Err(ErrorCode::NotFound, "unknown collection " + std::string(collection));
  }
  if (schema->key_column != key_column) {
    return Result::Err(ErrorCode::InvalidArgument, "column " + std::string(key_column) + " is not the key of " + schema->name);
  }
  *out = schema;
  return Result::Ok();
}

} // namespace backoffice::db::schema
