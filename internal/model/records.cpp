#include "records.hpp"

#include <stdexcept>

namespace backoffice::model {

using db::Cell;
using db::Row;

namespace {

[[noreturn]] void Malformed(const Row& row, const std::string& column) {
  throw std::runtime_error("malformed cell " + column + "='" + Cell(row, column) + "'");
}

Cents MoneyCell(const Row& row, const std::string& column) {
  const auto& text = Cell(row, column);
  if (text.empty()) return 0;
  auto value = util::TryParseMoney(text);
  if (!value) Malformed(row, column);
  return *value;
}

std::int64_t IntCell(const Row& row, const std::string& column) {
  const auto& text = Cell(row, column);
  if (text.empty()) return 0;
  auto value = util::TryParseInt64(text);
  if (!value) Malformed(row, column);
  return *value;
}

PaymentMode PaymentModeCell(const Row& row, const std::string& column) {
  auto mode = ParsePaymentMode(Cell(row, column));
  if (!mode) Malformed(row, column);
  return *mode;
}

SaleStatus SaleStatusCell(const Row& row, const std::string& column) {
  auto status = ParseSaleStatus(Cell(row, column));
  if (!status) Malformed(row, column);
  return *status;
}

std::vector<BatchTake> BreakdownCell(const Row& row, const std::string& column) {
  try {
    return ParseBreakdown(Cell(row, column));
  } catch (const std::invalid_argument&) {
    Malformed(row, column);
  }
}

} // namespace

// ---------------------------------------------------------------------------
// Batch breakdown
// ---------------------------------------------------------------------------

std::string FormatBreakdown(const std::vector<BatchTake>& takes) {
  std::string out;
  for (const auto& take : takes) {
    if (!out.empty()) out += ";";
    out += take.batch_id + ":" + std::to_string(take.qty) + "@" + util::FormatMoney(take.unit_cost);
  }
  return out;
}

std::vector<BatchTake> ParseBreakdown(std::string_view text) {
  std::vector<BatchTake> takes;
  while (!text.empty()) {
    const auto end   = text.find(';');
    const auto entry = text.substr(0, end);
    text             = end == std::string_view::npos ? std::string_view{} : text.substr(end + 1);

    const auto colon = entry.find(':');
    const auto at    = entry.find('@');
    if (colon == std::string_view::npos || at == std::string_view::npos || at < colon || colon == 0) {
      throw std::invalid_argument("malformed batch breakdown entry: " + std::string(entry));
    }

    auto qty  = util::TryParseInt64(entry.substr(colon + 1, at - colon - 1));
    auto cost = util::TryParseMoney(entry.substr(at + 1));
    if (!qty || *qty <= 0 || !cost) {
      throw std::invalid_argument("malformed batch breakdown entry: " + std::string(entry));
    }
    takes.push_back({std::string(entry.substr(0, colon)), *qty, *cost});
  }
  return takes;
}

// ---------------------------------------------------------------------------
// Rows
// ---------------------------------------------------------------------------

Row ToRow(const Item& item) {
  return {{"item_id", item.item_id},
          {"name", item.name},
          {"category", item.category},
          {"unit_price", util::FormatMoney(item.unit_price)},
          {"last_cost", util::FormatMoney(item.last_cost)},
          {"reorder_level", std::to_string(item.reorder_level)},
          {"status", item.status},
          {"created_at", item.created_at}};
}

Item ItemFromRow(const Row& row) {
  Item item;
  item.item_id       = Cell(row, "item_id");
  item.name          = Cell(row, "name");
  item.category      = Cell(row, "category");
  item.unit_price    = MoneyCell(row, "unit_price");
  item.last_cost     = MoneyCell(row, "last_cost");
  item.reorder_level = IntCell(row, "reorder_level");
  item.status        = Cell(row, "status");
  item.created_at    = Cell(row, "created_at");
  return item;
}

Row ToRow(const StockBatch& batch) {
  return {{"batch_id", batch.batch_id},
          {"item_id", batch.item_id},
          {"quantity_received", std::to_string(batch.quantity_received)},
          {"quantity_remaining", std::to_string(batch.quantity_remaining)},
          {"unit_cost", util::FormatMoney(batch.unit_cost)},
          {"received_at", batch.received_at},
          {"received_at_ms", std::to_string(batch.received_at_ms)},
          {"source", std::string(ToString(batch.source))},
          {"reference_id", batch.reference_id}};
}

StockBatch StockBatchFromRow(const Row& row) {
  StockBatch batch;
  batch.batch_id           = Cell(row, "batch_id");
  batch.item_id            = Cell(row, "item_id");
  batch.quantity_received  = IntCell(row, "quantity_received");
  batch.quantity_remaining = IntCell(row, "quantity_remaining");
  batch.unit_cost          = MoneyCell(row, "unit_cost");
  batch.received_at        = Cell(row, "received_at");
  batch.received_at_ms     = IntCell(row, "received_at_ms");
  auto source              = ParseBatchSource(Cell(row, "source"));
  if (!source) Malformed(row, "source");
  batch.source       = *source;
  batch.reference_id = Cell(row, "reference_id");
  if (batch.quantity_remaining < 0) Malformed(row, "quantity_remaining");
  return batch;
}

Row ToRow(const Customer& customer) {
  return {{"customer_id", customer.customer_id},
          {"name", customer.name},
          {"phone", customer.phone},
          {"email", customer.email},
          {"credit_limit", util::FormatMoney(customer.credit_limit)},
          {"current_balance", util::FormatMoney(customer.current_balance)},
          {"total_purchases", util::FormatMoney(customer.total_purchases)},
          {"last_purchase_date", customer.last_purchase_date},
          {"status", customer.status},
          {"created_at", customer.created_at}};
}

Customer CustomerFromRow(const Row& row) {
  Customer customer;
  customer.customer_id        = Cell(row, "customer_id");
  customer.name               = Cell(row, "name");
  customer.phone              = Cell(row, "phone");
  customer.email              = Cell(row, "email");
  customer.credit_limit       = MoneyCell(row, "credit_limit");
  customer.current_balance    = MoneyCell(row, "current_balance");
  customer.total_purchases    = MoneyCell(row, "total_purchases");
  customer.last_purchase_date = Cell(row, "last_purchase_date");
  customer.status             = Cell(row, "status");
  customer.created_at         = Cell(row, "created_at");
  return customer;
}

Row ToRow(const Supplier& supplier) {
  return {{"supplier_id", supplier.supplier_id},
          {"name", supplier.name},
          {"phone", supplier.phone},
          {"email", supplier.email},
          {"current_balance", util::FormatMoney(supplier.current_balance)},
          {"status", supplier.status},
          {"created_at", supplier.created_at}};
}

Supplier SupplierFromRow(const Row& row) {
  Supplier supplier;
  supplier.supplier_id     = Cell(row, "supplier_id");
  supplier.name            = Cell(row, "name");
  supplier.phone           = Cell(row, "phone");
  supplier.email           = Cell(row, "email");
  supplier.current_balance = MoneyCell(row, "current_balance");
  supplier.status          = Cell(row, "status");
  supplier.created_at      = Cell(row, "created_at");
  return supplier;
}

Row ToRow(const SaleHeader& header) {
  return {{"transaction_id", header.transaction_id},
          {"date_time", header.date_time},
          {"date_time_ms", std::to_string(header.date_time_ms)},
          {"type", header.type},
          {"customer_id", header.customer_id},
          {"payment_mode", std::string(ToString(header.payment_mode))},
          {"status", std::string(ToString(header.status))},
          {"subtotal", util::FormatMoney(header.subtotal)},
          {"delivery_charge", util::FormatMoney(header.delivery_charge)},
          {"discount", util::FormatMoney(header.discount)},
          {"grand_total", util::FormatMoney(header.grand_total)},
          {"total_cost", util::FormatMoney(header.total_cost)},
          {"created_by", header.created_by},
          {"converted_from", header.converted_from},
          {"notes", header.notes}};
}

SaleHeader SaleHeaderFromRow(const Row& row) {
  SaleHeader header;
  header.transaction_id  = Cell(row, "transaction_id");
  header.date_time       = Cell(row, "date_time");
  header.date_time_ms    = IntCell(row, "date_time_ms");
  header.type            = Cell(row, "type");
  header.customer_id     = Cell(row, "customer_id");
  header.payment_mode    = PaymentModeCell(row, "payment_mode");
  header.status          = SaleStatusCell(row, "status");
  header.subtotal        = MoneyCell(row, "subtotal");
  header.delivery_charge = MoneyCell(row, "delivery_charge");
  header.discount        = MoneyCell(row, "discount");
  header.grand_total     = MoneyCell(row, "grand_total");
  header.total_cost      = MoneyCell(row, "total_cost");
  header.created_by      = Cell(row, "created_by");
  header.converted_from  = Cell(row, "converted_from");
  header.notes           = Cell(row, "notes");
  return header;
}

Row ToRow(const SaleLine& line) {
  return {{"line_id", line.line_id},
          {"transaction_id", line.transaction_id},
          {"line_no", std::to_string(line.line_no)},
          {"item_id", line.item_id},
          {"qty", std::to_string(line.qty)},
          {"unit_price", util::FormatMoney(line.unit_price)},
          {"line_total", util::FormatMoney(line.line_total)},
          {"cost_of_goods_sold", util::FormatMoney(line.cost_of_goods_sold)},
          {"batch_breakdown", FormatBreakdown(line.breakdown)}};
}

SaleLine SaleLineFromRow(const Row& row) {
  SaleLine line;
  line.line_id            = Cell(row, "line_id");
  line.transaction_id     = Cell(row, "transaction_id");
  line.line_no            = IntCell(row, "line_no");
  line.item_id            = Cell(row, "item_id");
  line.qty                = IntCell(row, "qty");
  line.unit_price         = MoneyCell(row, "unit_price");
  line.line_total         = MoneyCell(row, "line_total");
  line.cost_of_goods_sold = MoneyCell(row, "cost_of_goods_sold");
  line.breakdown          = BreakdownCell(row, "batch_breakdown");
  return line;
}

Row ToRow(const StatusEvent& event) {
  return {{"event_id", event.event_id},
          {"transaction_id", event.transaction_id},
          {"from_status", std::string(ToString(event.from_status))},
          {"to_status", std::string(ToString(event.to_status))},
          {"reason", event.reason},
          {"changed_by", event.changed_by},
          {"changed_at", event.changed_at}};
}

StatusEvent StatusEventFromRow(const Row& row) {
  StatusEvent event;
  event.event_id       = Cell(row, "event_id");
  event.transaction_id = Cell(row, "transaction_id");
  event.from_status    = SaleStatusCell(row, "from_status");
  event.to_status      = SaleStatusCell(row, "to_status");
  event.reason         = Cell(row, "reason");
  event.changed_by     = Cell(row, "changed_by");
  event.changed_at     = Cell(row, "changed_at");
  return event;
}

Row ToRow(const SaleReturn& ret) {
  return {{"return_id", ret.return_id},
          {"transaction_id", ret.transaction_id},
          {"line_id", ret.line_id},
          {"item_id", ret.item_id},
          {"qty", std::to_string(ret.qty)},
          {"refund_amount", util::FormatMoney(ret.refund_amount)},
          {"cost_restored", util::FormatMoney(ret.cost_restored)},
          {"batch_breakdown", FormatBreakdown(ret.breakdown)},
          {"reason", ret.reason},
          {"created_by", ret.created_by},
          {"created_at", ret.created_at}};
}

SaleReturn SaleReturnFromRow(const Row& row) {
  SaleReturn ret;
  ret.return_id      = Cell(row, "return_id");
  ret.transaction_id = Cell(row, "transaction_id");
  ret.line_id        = Cell(row, "line_id");
  ret.item_id        = Cell(row, "item_id");
  ret.qty            = IntCell(row, "qty");
  ret.refund_amount  = MoneyCell(row, "refund_amount");
  ret.cost_restored  = MoneyCell(row, "cost_restored");
  ret.breakdown      = BreakdownCell(row, "batch_breakdown");
  ret.reason         = Cell(row, "reason");
  ret.created_by     = Cell(row, "created_by");
  ret.created_at     = Cell(row, "created_at");
  return ret;
}

Row ToRow(const QuotationHeader& header) {
  return {{"transaction_id", header.transaction_id},
          {"date_time", header.date_time},
          {"type", header.type},
          {"customer_id", header.customer_id},
          {"status", std::string(ToString(header.status))},
          {"subtotal", util::FormatMoney(header.subtotal)},
          {"delivery_charge", util::FormatMoney(header.delivery_charge)},
          {"discount", util::FormatMoney(header.discount)},
          {"grand_total", util::FormatMoney(header.grand_total)},
          {"valid_until", header.valid_until},
          {"valid_until_ms", std::to_string(header.valid_until_ms)},
          {"converted_sale_id", header.converted_sale_id},
          {"created_by", header.created_by},
          {"notes", header.notes}};
}

QuotationHeader QuotationHeaderFromRow(const Row& row) {
  QuotationHeader header;
  header.transaction_id = Cell(row, "transaction_id");
  header.date_time      = Cell(row, "date_time");
  header.type           = Cell(row, "type");
  header.customer_id    = Cell(row, "customer_id");
  auto status           = ParseQuotationStatus(Cell(row, "status"));
  if (!status) Malformed(row, "status");
  header.status            = *status;
  header.subtotal          = MoneyCell(row, "subtotal");
  header.delivery_charge   = MoneyCell(row, "delivery_charge");
  header.discount          = MoneyCell(row, "discount");
  header.grand_total       = MoneyCell(row, "grand_total");
  header.valid_until       = Cell(row, "valid_until");
  header.valid_until_ms    = IntCell(row, "valid_until_ms");
  header.converted_sale_id = Cell(row, "converted_sale_id");
  header.created_by        = Cell(row, "created_by");
  header.notes             = Cell(row, "notes");
  return header;
}

Row ToRow(const QuotationLine& line) {
  return {{"line_id", line.line_id},
          {"transaction_id", line.transaction_id},
          {"line_no", std::to_string(line.line_no)},
          {"item_id", line.item_id},
          {"qty", std::to_string(line.qty)},
          {"unit_price", util::FormatMoney(line.unit_price)},
          {"line_total", util::FormatMoney(line.line_total)}};
}

QuotationLine QuotationLineFromRow(const Row& row) {
  QuotationLine line;
  line.line_id        = Cell(row, "line_id");
  line.transaction_id = Cell(row, "transaction_id");
  line.line_no        = IntCell(row, "line_no");
  line.item_id        = Cell(row, "item_id");
  line.qty            = IntCell(row, "qty");
  line.unit_price     = MoneyCell(row, "unit_price");
  line.line_total     = MoneyCell(row, "line_total");
  return line;
}

Row ToRow(const Purchase& purchase) {
  return {{"purchase_id", purchase.purchase_id},
          {"supplier_id", purchase.supplier_id},
          {"item_id", purchase.item_id},
          {"qty", std::to_string(purchase.qty)},
          {"unit_cost", util::FormatMoney(purchase.unit_cost)},
          {"total_cost", util::FormatMoney(purchase.total_cost)},
          {"batch_id", purchase.batch_id},
          {"payment_mode", std::string(ToString(purchase.payment_mode))},
          {"created_by", purchase.created_by},
          {"created_at", purchase.created_at}};
}

Purchase PurchaseFromRow(const Row& row) {
  Purchase purchase;
  purchase.purchase_id  = Cell(row, "purchase_id");
  purchase.supplier_id  = Cell(row, "supplier_id");
  purchase.item_id      = Cell(row, "item_id");
  purchase.qty          = IntCell(row, "qty");
  purchase.unit_cost    = MoneyCell(row, "unit_cost");
  purchase.total_cost   = MoneyCell(row, "total_cost");
  purchase.batch_id     = Cell(row, "batch_id");
  purchase.payment_mode = PaymentModeCell(row, "payment_mode");
  purchase.created_by   = Cell(row, "created_by");
  purchase.created_at   = Cell(row, "created_at");
  return purchase;
}

Row ToRow(const LedgerEntry& entry) {
  return {{"entry_id", entry.entry_id},
          {"date_time", entry.date_time},
          {"account", entry.account},
          {"reference_id", entry.reference_id},
          {"description", entry.description},
          {"debit", util::FormatMoney(entry.debit)},
          {"credit", util::FormatMoney(entry.credit)},
          {"created_by", entry.created_by}};
}

LedgerEntry LedgerEntryFromRow(const Row& row) {
  LedgerEntry entry;
  entry.entry_id     = Cell(row, "entry_id");
  entry.date_time    = Cell(row, "date_time");
  entry.account      = Cell(row, "account");
  entry.reference_id = Cell(row, "reference_id");
  entry.description  = Cell(row, "description");
  entry.debit        = MoneyCell(row, "debit");
  entry.credit       = MoneyCell(row, "credit");
  entry.created_by   = Cell(row, "created_by");
  return entry;
}

} // namespace backoffice::model
