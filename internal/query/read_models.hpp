#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/records.hpp"

namespace backoffice::query {

using util::Cents;

struct SaleSummary {
  std::string        transaction_id;
  std::string        date_time;
  std::int64_t       date_time_ms = 0;
  std::string        customer_id;
  model::PaymentMode payment_mode = model::PaymentMode::kCash;
  model::SaleStatus  status       = model::SaleStatus::kCompleted;
  Cents              grand_total  = 0;
  Cents              total_cost   = 0;
  std::string        converted_from;
};

struct InventoryPosition {
  std::string  item_id;
  std::string  name;
  std::string  category;
  Cents        unit_price    = 0;
  Cents        last_cost     = 0;
  std::int64_t stock         = 0;
  Cents        stock_value   = 0; // remaining units at their batch cost
  std::int64_t reorder_level = 0;
  bool         needs_reorder = false;
  std::string  status;
};

struct DashboardSummary {
  std::string  date;
  std::int64_t sales_count        = 0;
  Cents        revenue            = 0;
  Cents        cogs               = 0;
  Cents        gross_profit       = 0;
  Cents        receivables        = 0;
  std::int64_t low_stock_count    = 0;
  std::int64_t pending_quotations = 0;
  Cents        stock_value        = 0;
};

enum class DataDomain : std::uint8_t {
  kInventory,
  kCustomers,
  kSuppliers,
  kSales,
  kQuotations,
  kDashboard,
  kAll,
};

constexpr std::string_view ToString(DataDomain domain) {
  switch (domain) {
    case DataDomain::kInventory:
      return "inventory";
    case DataDomain::kCustomers:
      return "customers";
    case DataDomain::kSuppliers:
      return "suppliers";
    case DataDomain::kSales:
      return "sales";
    case DataDomain::kQuotations:
      return "quotations";
    case DataDomain::kDashboard:
      return "dashboard";
    case DataDomain::kAll:
      return "all";
  }
  return "unknown";
}

struct RefreshReport {
  DataDomain  domain  = DataDomain::kAll;
  std::size_t records = 0; // rows in the freshly loaded read models
};

} // namespace backoffice::query
