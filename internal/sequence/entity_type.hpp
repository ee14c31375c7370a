#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "internal/db/schema/collections.hpp"

namespace backoffice::sequence {

enum class EntityType : std::uint8_t {
  kSale,
  kQuotation,
  kCustomer,
  kSupplier,
  kItem,
  kBatch,
  kPurchase,
  kLedgerEntry,
  kStatusEvent,
  kReturn,
  kSaleLine,
  kQuotationLine,
};

struct EntityInfo {
  EntityType       type;
  std::string_view collection;
  std::string_view key_column;
  std::string_view prefix;
  // child rows referencing the id; they can outlive a header whose write failed
  std::string_view child_collection = {};
  std::string_view child_column     = {};
};

inline constexpr std::array<EntityInfo, 12> kEntities = {{
    {EntityType::kSale, db::schema::kSales, "transaction_id", "SALE", db::schema::kSaleItems, "transaction_id"},
    {EntityType::kQuotation, db::schema::kQuotations, "transaction_id", "QUOT", db::schema::kQuotationItems, "transaction_id"},
    {EntityType::kCustomer, db::schema::kCustomers, "customer_id", "CUST"},
    {EntityType::kSupplier, db::schema::kSuppliers, "supplier_id", "SUPP"},
    {EntityType::kItem, db::schema::kItems, "item_id", "ITEM"},
    {EntityType::kBatch, db::schema::kStockBatches, "batch_id", "BATCH"},
    {EntityType::kPurchase, db::schema::kPurchases, "purchase_id", "PUR"},
    {EntityType::kLedgerEntry, db::schema::kLedger, "entry_id", "LED"},
    {EntityType::kStatusEvent, db::schema::kSaleStatusLog, "event_id", "STS"},
    {EntityType::kReturn, db::schema::kSaleReturns, "return_id", "RET"},
    {EntityType::kSaleLine, db::schema::kSaleItems, "line_id", "LINE"},
    {EntityType::kQuotationLine, db::schema::kQuotationItems, "line_id", "QLN"},
}};

constexpr const EntityInfo& Info(EntityType type) {
  return kEntities[static_cast<std::size_t>(type)];
}

} // namespace backoffice::sequence
