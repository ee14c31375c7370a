#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/record_store.hpp"
#include "internal/model/status.hpp"
#include "internal/util/numeric.hpp"

namespace backoffice::model {

using util::Cents;

/*
  Typed views of record store rows.

  ToRow renders every column of the collection; the *FromRow functions
  throw std::runtime_error when a stored cell cannot be parsed, since that
  means the store was edited by hand into an inconsistent state.
*/

struct Item {
  std::string  item_id;
  std::string  name;
  std::string  category;
  Cents        unit_price    = 0;
  Cents        last_cost     = 0;
  std::int64_t reorder_level = 0;
  std::string  status        = std::string(kActive);
  std::string  created_at;

  bool active() const {
    return status == kActive;
  }
};

struct StockBatch {
  std::string  batch_id;
  std::string  item_id;
  std::int64_t quantity_received  = 0;
  std::int64_t quantity_remaining = 0;
  Cents        unit_cost          = 0;
  std::string  received_at;
  std::int64_t received_at_ms = 0;
  BatchSource  source         = BatchSource::kPurchase;
  std::string  reference_id;
};

struct Customer {
  std::string customer_id;
  std::string name;
  std::string phone;
  std::string email;
  Cents       credit_limit    = 0;
  Cents       current_balance = 0;
  Cents       total_purchases = 0;
  std::string last_purchase_date;
  std::string status = std::string(kActive);
  std::string created_at;

  bool active() const {
    return status == kActive;
  }
};

struct Supplier {
  std::string supplier_id;
  std::string name;
  std::string phone;
  std::string email;
  Cents       current_balance = 0;
  std::string status          = std::string(kActive);
  std::string created_at;
};

// Quantity taken from (or returned to) one batch at that batch's cost.
struct BatchTake {
  std::string  batch_id;
  std::int64_t qty       = 0;
  Cents        unit_cost = 0;

  bool operator==(const BatchTake&) const = default;
};

// "BATCH0001:5@10.00;BATCH0002:2@12.00"
std::string            FormatBreakdown(const std::vector<BatchTake>& takes);
std::vector<BatchTake> ParseBreakdown(std::string_view text);

struct SaleHeader {
  std::string  transaction_id;
  std::string  date_time;
  std::int64_t date_time_ms = 0;
  std::string  type         = "Sale";
  std::string  customer_id;
  PaymentMode  payment_mode    = PaymentMode::kCash;
  SaleStatus   status          = SaleStatus::kCompleted;
  Cents        subtotal        = 0;
  Cents        delivery_charge = 0;
  Cents        discount        = 0;
  Cents        grand_total     = 0;
  Cents        total_cost      = 0;
  std::string  created_by;
  std::string  converted_from;
  std::string  notes;
};

struct SaleLine {
  std::string            line_id;
  std::string            transaction_id;
  std::int64_t           line_no = 0;
  std::string            item_id;
  std::int64_t           qty                = 0;
  Cents                  unit_price         = 0;
  Cents                  line_total         = 0;
  Cents                  cost_of_goods_sold = 0;
  std::vector<BatchTake> breakdown;
};

struct StatusEvent {
  std::string event_id;
  std::string transaction_id;
  SaleStatus  from_status = SaleStatus::kCompleted;
  SaleStatus  to_status   = SaleStatus::kCompleted;
  std::string reason;
  std::string changed_by;
  std::string changed_at;
};

struct SaleReturn {
  std::string            return_id;
  std::string            transaction_id;
  std::string            line_id;
  std::string            item_id;
  std::int64_t           qty           = 0;
  Cents                  refund_amount = 0;
  Cents                  cost_restored = 0;
  std::vector<BatchTake> breakdown;
  std::string            reason;
  std::string            created_by;
  std::string            created_at;
};

struct QuotationHeader {
  std::string     transaction_id;
  std::string     date_time;
  std::string     type = "Quotation";
  std::string     customer_id;
  QuotationStatus status          = QuotationStatus::kPending;
  Cents           subtotal        = 0;
  Cents           delivery_charge = 0;
  Cents           discount        = 0;
  Cents           grand_total     = 0;
  std::string     valid_until;
  std::int64_t    valid_until_ms = 0;
  std::string     converted_sale_id;
  std::string     created_by;
  std::string     notes;
};

struct QuotationLine {
  std::string  line_id;
  std::string  transaction_id;
  std::int64_t line_no = 0;
  std::string  item_id;
  std::int64_t qty        = 0;
  Cents        unit_price = 0;
  Cents        line_total = 0;
};

struct Purchase {
  std::string  purchase_id;
  std::string  supplier_id;
  std::string  item_id;
  std::int64_t qty        = 0;
  Cents        unit_cost  = 0;
  Cents        total_cost = 0;
  std::string  batch_id;
  PaymentMode  payment_mode = PaymentMode::kCash;
  std::string  created_by;
  std::string  created_at;
};

struct LedgerEntry {
  std::string entry_id;
  std::string date_time;
  std::string account;
  std::string reference_id;
  std::string description;
  Cents       debit  = 0;
  Cents       credit = 0;
  std::string created_by;
};

db::Row ToRow(const Item& item);
db::Row ToRow(const StockBatch& batch);
db::Row ToRow(const Customer& customer);
db::Row ToRow(const Supplier& supplier);
db::Row ToRow(const SaleHeader& header);
db::Row ToRow(const SaleLine& line);
db::Row ToRow(const StatusEvent& event);
db::Row ToRow(const SaleReturn& ret);
db::Row ToRow(const QuotationHeader& header);
db::Row ToRow(const QuotationLine& line);
db::Row ToRow(const Purchase& purchase);
db::Row ToRow(const LedgerEntry& entry);

Item            ItemFromRow(const db::Row& row);
StockBatch      StockBatchFromRow(const db::Row& row);
Customer        CustomerFromRow(const db::Row& row);
Supplier        SupplierFromRow(const db::Row& row);
SaleHeader      SaleHeaderFromRow(const db::Row& row);
SaleLine        SaleLineFromRow(const db::Row& row);
StatusEvent     StatusEventFromRow(const db::Row& row);
SaleReturn      SaleReturnFromRow(const db::Row& row);
QuotationHeader QuotationHeaderFromRow(const db::Row& row);
QuotationLine   QuotationLineFromRow(const db::Row& row);
Purchase        PurchaseFromRow(const db::Row& row);
LedgerEntry     LedgerEntryFromRow(const db::Row& row);

} // namespace backoffice::model
