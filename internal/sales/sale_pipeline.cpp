#include "sale_pipeline.hpp"

#include <exception>

#include "internal/audit/audit_sink.hpp"
#include "internal/cache/query_cache.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/db/schema/collections.hpp"
#include "internal/db/write_guard.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sales/sale_loader.hpp"
#include "internal/sequence/sequence_allocator.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::sales {

using observability::IntField;
using observability::MoneyField;
using observability::StringField;
using sequence::EntityType;

namespace {

std::string LineSummary(const std::vector<model::SaleLine>& lines) {
  std::string summary;
  for (const auto& line : lines) {
    if (!summary.empty()) summary += ",";
    summary += line.item_id + "x" + std::to_string(line.qty) + "@" + util::FormatMoney(line.unit_price);
  }
  return summary;
}

std::string BalanceSnapshot(const std::optional<model::Customer>& customer) {
  if (!customer) return {};
  return "customer=" + customer->customer_id + " balance=" + util::FormatMoney(customer->current_balance) +
         " total_purchases=" + util::FormatMoney(customer->total_purchases);
}

} // namespace

SalePipeline::SalePipeline(core::CoreContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------
// Shared steps
// ------------------------------------------------------------

std::string SalePipeline::UserOrSystem(const std::string& user) {
  return user.empty() ? std::string("system") : user;
}

void SalePipeline::ValidateLines(const std::vector<LineRequest>& lines, Cents delivery_charge, Cents discount) {
  if (lines.empty()) {
    throw util::InvalidInput("at least one line item is required");
  }

  bool  all_priced = true;
  Cents subtotal   = 0;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto& line = lines[i];
    if (line.item_id.empty()) {
      throw util::InvalidInput("line " + std::to_string(i + 1) + ": item id is required");
    }
    if (line.qty <= 0) {
      throw util::InvalidInput("line " + std::to_string(i + 1) + ": quantity must be positive");
    }
    if (line.unit_price && *line.unit_price < 0) {
      throw util::InvalidInput("line " + std::to_string(i + 1) + ": unit price must not be negative");
    }
    if (line.unit_price) {
      subtotal += line.qty * *line.unit_price;
    } else {
      all_priced = false;
    }
  }

  if (delivery_charge < 0) {
    throw util::InvalidInput("delivery charge must not be negative");
  }
  if (discount < 0) {
    throw util::InvalidInput("discount must not be negative");
  }
  // list prices are only known under the lock; PriceOrder repeats this check
  if (all_priced && discount > subtotal + delivery_charge) {
    throw util::InvalidInput("discount exceeds subtotal plus delivery charge");
  }
}

SalePipeline::PricedOrder SalePipeline::PriceOrder(const std::vector<LineRequest>& lines, Cents delivery_charge, Cents discount) {
  PricedOrder order;
  order.delivery_charge = delivery_charge;
  order.discount        = discount;

  for (const auto& line : lines) {
    auto row = ctx_.store->FindByKey(db::schema::kItems, "item_id", line.item_id);
    if (!row) {
      throw util::NotFound("item " + line.item_id + " not found");
    }
    auto item = model::ItemFromRow(*row);
    if (!item.active()) {
      throw util::NotFound("item " + line.item_id + " is not active");
    }

    PricedLine priced;
    priced.item_id    = line.item_id;
    priced.qty        = line.qty;
    priced.unit_price = line.unit_price.value_or(item.unit_price);
    priced.line_total = priced.qty * priced.unit_price;
    order.subtotal += priced.line_total;
    order.lines.push_back(std::move(priced));
  }

  if (discount > order.subtotal + delivery_charge) {
    throw util::InvalidInput("discount " + util::FormatMoney(discount) + " exceeds subtotal plus delivery charge " +
                             util::FormatMoney(order.subtotal + delivery_charge));
  }
  order.grand_total = order.subtotal + delivery_charge - discount;
  return order;
}

model::Customer SalePipeline::RequireCustomer(const std::string& customer_id) {
  auto row = ctx_.store->FindByKey(db::schema::kCustomers, "customer_id", customer_id);
  if (!row) {
    throw util::NotFound("customer " + customer_id + " not found");
  }
  auto customer = model::CustomerFromRow(*row);
  if (!customer.active()) {
    throw util::NotFound("customer " + customer_id + " is not active");
  }
  return customer;
}

model::StatusEvent SalePipeline::MakeStatusEvent(const lock::Guard& guard, const std::string& transaction_id, model::SaleStatus from,
                                                 model::SaleStatus to, const std::string& reason, const std::string& user) {
  model::StatusEvent event;
  event.event_id       = ctx_.sequences->NextId(guard, EntityType::kStatusEvent);
  event.transaction_id = transaction_id;
  event.from_status    = from;
  event.to_status      = to;
  event.reason         = reason;
  event.changed_by     = user;
  event.changed_at     = util::FormatTimestamp(ctx_.now());
  return event;
}

void SalePipeline::InvalidateFamilies(std::span<const cache::CacheFamily> families) {
  try {
    ctx_.cache->Invalidate(families);
  } catch (const std::exception& e) {
    BACKOFFICE_LOG_ERROR("cache invalidation failed", {StringField("error", e.what())});
  }
}

void SalePipeline::Audit(const std::string& user, const std::string& action, const std::string& details, const std::string& before,
                         const std::string& after) {
  audit::Emit(*ctx_.audit, audit::AuditEvent{user, "Sales", action, details, before, after});
}

SalePipeline::StagedSale SalePipeline::StageSale(const lock::Guard& guard, OperationTrace& trace, const SaleRequest& request, const PricedOrder& order,
                                                 const std::string& converted_from) {
  StagedSale staged;
  const auto user = UserOrSystem(request.user);
  const auto now  = ctx_.now();

  // stock first: the first shortfall aborts with nothing staged for writing
  for (std::size_t i = 0; i < order.lines.size(); ++i) {
    const auto& priced   = order.lines[i];
    auto        consumed = ctx_.inventory->Consume(guard, staged.stock, priced.item_id, priced.qty);

    model::SaleLine line;
    line.line_no            = static_cast<std::int64_t>(i + 1);
    line.item_id            = priced.item_id;
    line.qty                = priced.qty;
    line.unit_price         = priced.unit_price;
    line.line_total         = priced.line_total;
    line.cost_of_goods_sold = consumed.cogs;
    line.breakdown          = std::move(consumed.takes);
    staged.header.total_cost += line.cost_of_goods_sold;
    staged.lines.push_back(std::move(line));
  }

  if (!request.customer_id.empty()) {
    auto customer = RequireCustomer(request.customer_id);
    if (request.payment_mode == model::PaymentMode::kCredit && customer.current_balance + order.grand_total > customer.credit_limit) {
      BACKOFFICE_LOG_WARN("credit limit exceeded", {StringField("customer_id", customer.customer_id), MoneyField("balance", customer.current_balance),
                                                    MoneyField("limit", customer.credit_limit), MoneyField("amount", order.grand_total)});
      throw util::CreditLimitExceeded(customer.customer_id, customer.current_balance, customer.credit_limit, order.grand_total);
    }

    staged.customer_patch = {{"total_purchases", util::FormatMoney(customer.total_purchases + order.grand_total)},
                             {"last_purchase_date", util::FormatDate(now)}};
    if (request.payment_mode == model::PaymentMode::kCredit) {
      staged.customer_patch["current_balance"] = util::FormatMoney(customer.current_balance + order.grand_total);
    }
    staged.customer_before = std::move(customer);
  }

  // ids last, under the same guard as the writes that land them
  auto& header           = staged.header;
  header.transaction_id  = ctx_.sequences->NextId(guard, EntityType::kSale);
  header.date_time       = util::FormatTimestamp(now);
  header.date_time_ms    = util::ToUnixMillis(now);
  header.customer_id     = request.customer_id;
  header.payment_mode    = request.payment_mode;
  header.status          = model::SaleStatus::kCompleted;
  header.subtotal        = order.subtotal;
  header.delivery_charge = order.delivery_charge;
  header.discount        = order.discount;
  header.grand_total     = order.grand_total;
  header.created_by      = user;
  header.converted_from  = converted_from;
  header.notes           = request.notes;
  trace.SetSubject(header.transaction_id);

  for (auto& line : staged.lines) {
    line.line_id        = ctx_.sequences->NextId(guard, EntityType::kSaleLine);
    line.transaction_id = header.transaction_id;
  }

  auto& ledger        = staged.ledger;
  ledger.entry_id     = ctx_.sequences->NextId(guard, EntityType::kLedgerEntry);
  ledger.date_time    = header.date_time;
  ledger.account      = std::string(model::LedgerAccount(request.payment_mode));
  ledger.reference_id = header.transaction_id;
  ledger.description  = "Sale " + header.transaction_id + (converted_from.empty() ? "" : " from " + converted_from);
  ledger.debit        = order.grand_total;
  ledger.created_by   = user;

  return staged;
}

void SalePipeline::PersistSale(const StagedSale& staged) {
  const auto& id = staged.header.transaction_id;

  // lines before the header: a sale is visible once its header exists
  std::vector<db::Row> line_rows;
  for (const auto& line : staged.lines) {
    line_rows.push_back(model::ToRow(line));
  }
  db::RequireWrite(ctx_.store->AppendRows(db::schema::kSaleItems, line_rows), "append lines of " + id);
  db::RequireWrite(ctx_.store->AppendRows(db::schema::kSales, {model::ToRow(staged.header)}), "append sale " + id);

  ctx_.inventory->Apply(staged.stock);

  if (staged.customer_before) {
    db::RequireUpdate(ctx_.store->UpdateByKey(db::schema::kCustomers, "customer_id", staged.customer_before->customer_id, staged.customer_patch),
                      "update customer " + staged.customer_before->customer_id);
  }

  db::RequireWrite(ctx_.store->AppendRows(db::schema::kLedger, {model::ToRow(staged.ledger)}), "append ledger entry for " + id);
}

// ------------------------------------------------------------
// CreateSale
// ------------------------------------------------------------

SaleResult SalePipeline::CreateSale(const SaleRequest& request) {
  OperationTrace trace("CreateSale");

  ValidateLines(request.lines, request.delivery_charge, request.discount);
  if (request.payment_mode == model::PaymentMode::kCredit && request.customer_id.empty()) {
    throw util::InvalidInput("customer is required for credit sales");
  }

  auto guard = ctx_.lock->Acquire("CreateSale");
  trace.Enter(PipelineState::kLocked);

  const auto order  = PriceOrder(request.lines, request.delivery_charge, request.discount);
  auto       staged = StageSale(guard, trace, request, order, "");

  trace.Enter(PipelineState::kCommitting);
  std::exception_ptr failure;
  try {
    PersistSale(staged);
  } catch (const util::StoreWriteFailure&) {
    failure = std::current_exception();
  }
  guard.Release();

  trace.Enter(PipelineState::kInvalidating);
  if (request.customer_id.empty()) {
    InvalidateFamilies(cache::kSaleInvalidations);
  } else {
    InvalidateFamilies(cache::kCustomerSaleInvalidations);
  }
  if (failure) std::rethrow_exception(failure);

  const auto& header = staged.header;
  trace.Enter(PipelineState::kAuditing);
  std::optional<model::Customer> after = staged.customer_before;
  if (after) {
    after->total_purchases += header.grand_total;
    if (header.payment_mode == model::PaymentMode::kCredit) after->current_balance += header.grand_total;
  }
  Audit(header.created_by, "CreateSale",
        header.transaction_id + " " + std::string(model::ToString(header.payment_mode)) + " total=" + util::FormatMoney(header.grand_total) +
            " lines=" + LineSummary(staged.lines),
        BalanceSnapshot(staged.customer_before), BalanceSnapshot(after));

  trace.Enter(PipelineState::kDone);
  BACKOFFICE_LOG_INFO("sale completed", {StringField("transaction_id", header.transaction_id), MoneyField("grand_total", header.grand_total),
                                         MoneyField("cogs", header.total_cost), IntField("lines", static_cast<std::int64_t>(staged.lines.size()))});
  return {header.transaction_id, header.grand_total, header.total_cost};
}

// ------------------------------------------------------------
// CancelSale
// ------------------------------------------------------------

CancelResult SalePipeline::CancelSale(const CancelRequest& request) {
  OperationTrace trace("CancelSale");
  trace.SetSubject(request.transaction_id);

  if (request.transaction_id.empty()) {
    throw util::InvalidInput("transaction id is required");
  }
  if (request.reason.empty()) {
    throw util::InvalidInput("a cancellation reason is required");
  }
  const auto user = UserOrSystem(request.user);

  auto guard = ctx_.lock->Acquire("CancelSale");
  trace.Enter(PipelineState::kLocked);

  auto sale = LoadSale(*ctx_.store, request.transaction_id);
  if (!sale) {
    throw util::NotFound("sale " + request.transaction_id + " not found");
  }
  if (sale->effective_status != model::SaleStatus::kCompleted) {
    throw util::InvalidState("sale " + request.transaction_id + " is " + std::string(model::ToString(sale->effective_status)) +
                             "; only Completed sales can be cancelled");
  }
  const auto& header = sale->header;

  CancelResult          result;
  inventory::StockStage stage;
  for (const auto& line : sale->lines) {
    if (!line.breakdown.empty()) {
      result.cost_restored += ctx_.inventory->Restore(guard, stage, line.item_id, line.breakdown);
      continue;
    }
    auto        item_row  = ctx_.store->FindByKey(db::schema::kItems, "item_id", line.item_id);
    util::Cents last_cost = item_row ? model::ItemFromRow(*item_row).last_cost : 0;
    ctx_.inventory->RestoreAtCost(guard, stage, line.item_id, line.qty, last_cost, model::BatchSource::kRestore, header.transaction_id, true);
    result.cost_restored += line.qty * last_cost;
  }
  result.reversed = header.grand_total;

  std::optional<model::Customer> customer_before;
  db::Row                        customer_patch;
  if (!header.customer_id.empty()) {
    auto row = ctx_.store->FindByKey(db::schema::kCustomers, "customer_id", header.customer_id);
    if (!row) {
      throw util::NotFound("customer " + header.customer_id + " of sale " + header.transaction_id + " not found");
    }
    customer_before = model::CustomerFromRow(*row);
    customer_patch  = {{"total_purchases", util::FormatMoney(customer_before->total_purchases - header.grand_total)}};
    if (header.payment_mode == model::PaymentMode::kCredit) {
      customer_patch["current_balance"] = util::FormatMoney(customer_before->current_balance - header.grand_total);
    }
  }

  model::LedgerEntry reversal;
  reversal.entry_id     = ctx_.sequences->NextId(guard, EntityType::kLedgerEntry);
  reversal.date_time    = util::FormatTimestamp(ctx_.now());
  reversal.account      = std::string(model::LedgerAccount(header.payment_mode));
  reversal.reference_id = header.transaction_id;
  reversal.description  = "Cancellation of " + header.transaction_id + ": " + request.reason;
  reversal.credit       = header.grand_total;
  reversal.created_by   = user;

  const auto event = MakeStatusEvent(guard, header.transaction_id, model::SaleStatus::kCompleted, model::SaleStatus::kCancelled, request.reason, user);

  trace.Enter(PipelineState::kCommitting);
  std::exception_ptr failure;
  try {
    ctx_.inventory->Apply(stage);
    if (customer_before) {
      db::RequireUpdate(ctx_.store->UpdateByKey(db::schema::kCustomers, "customer_id", header.customer_id, customer_patch),
                        "update customer " + header.customer_id);
    }
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kLedger, {model::ToRow(reversal)}), "append reversal for " + header.transaction_id);
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kSaleStatusLog, {model::ToRow(event)}), "append cancellation of " + header.transaction_id);
  } catch (const util::StoreWriteFailure&) {
    failure = std::current_exception();
  }
  guard.Release();

  trace.Enter(PipelineState::kInvalidating);
  if (header.customer_id.empty()) {
    InvalidateFamilies(cache::kSaleInvalidations);
  } else {
    InvalidateFamilies(cache::kCustomerSaleInvalidations);
  }
  if (failure) std::rethrow_exception(failure);

  trace.Enter(PipelineState::kAuditing);
  Audit(user, "CancelSale", header.transaction_id + " reason=" + request.reason + " restored_cost=" + util::FormatMoney(result.cost_restored),
        "status=Completed " + BalanceSnapshot(customer_before), "status=Cancelled");

  trace.Enter(PipelineState::kDone);
  BACKOFFICE_LOG_INFO("sale cancelled", {StringField("transaction_id", header.transaction_id), MoneyField("reversed", result.reversed),
                                         MoneyField("cost_restored", result.cost_restored)});
  return result;
}

// ------------------------------------------------------------
// ConvertQuotationToSale
// ------------------------------------------------------------

SaleResult SalePipeline::ConvertQuotationToSale(const ConvertRequest& request) {
  OperationTrace trace("ConvertQuotationToSale");
  trace.SetSubject(request.quotation_id);

  if (request.quotation_id.empty()) {
    throw util::InvalidInput("quotation id is required");
  }

  auto guard = ctx_.lock->Acquire("ConvertQuotationToSale");
  trace.Enter(PipelineState::kLocked);

  // re-validated here: the quotation may have changed since the caller read it
  auto quote = LoadQuotation(*ctx_.store, request.quotation_id);
  if (!quote) {
    throw util::NotFound("quotation " + request.quotation_id + " not found");
  }
  const auto& q = quote->header;
  if (q.status == model::QuotationStatus::kConverted || !q.converted_sale_id.empty()) {
    throw util::InvalidState("quotation " + q.transaction_id + " was already converted to " + q.converted_sale_id);
  }
  if (!model::CanConvert(q.status)) {
    throw util::InvalidState("quotation " + q.transaction_id + " is " + std::string(model::ToString(q.status)) + " and cannot be converted");
  }
  if (q.valid_until_ms > 0 && util::ToUnixMillis(ctx_.now()) > q.valid_until_ms) {
    throw util::InvalidState("quotation " + q.transaction_id + " expired on " + q.valid_until);
  }
  if (quote->lines.empty()) {
    throw util::InvalidState("quotation " + q.transaction_id + " has no lines");
  }

  SaleRequest sale_request;
  sale_request.customer_id     = q.customer_id;
  sale_request.payment_mode    = request.payment_mode;
  sale_request.delivery_charge = q.delivery_charge;
  sale_request.discount        = q.discount;
  sale_request.user            = request.user;
  sale_request.notes           = q.notes;
  for (const auto& line : quote->lines) {
    sale_request.lines.push_back({line.item_id, line.qty, line.unit_price});
  }
  if (sale_request.payment_mode == model::PaymentMode::kCredit && sale_request.customer_id.empty()) {
    throw util::InvalidInput("customer is required for credit sales");
  }
  ValidateLines(sale_request.lines, sale_request.delivery_charge, sale_request.discount);

  const auto order  = PriceOrder(sale_request.lines, sale_request.delivery_charge, sale_request.discount);
  auto       staged = StageSale(guard, trace, sale_request, order, q.transaction_id);

  trace.Enter(PipelineState::kCommitting);
  std::exception_ptr failure;
  try {
    PersistSale(staged);
    db::RequireUpdate(ctx_.store->UpdateByKey(db::schema::kQuotations, "transaction_id", q.transaction_id,
                                              {{"status", std::string(model::ToString(model::QuotationStatus::kConverted))},
                                               {"converted_sale_id", staged.header.transaction_id}}),
                      "mark quotation " + q.transaction_id + " converted");
  } catch (const util::StoreWriteFailure&) {
    failure = std::current_exception();
  }
  guard.Release();

  trace.Enter(PipelineState::kInvalidating);
  if (q.customer_id.empty()) {
    InvalidateFamilies(cache::kConversionInvalidations);
  } else {
    InvalidateFamilies(cache::kCustomerConversionInvalidations);
  }
  if (failure) std::rethrow_exception(failure);

  const auto& header = staged.header;
  trace.Enter(PipelineState::kAuditing);
  Audit(header.created_by, "ConvertQuotation",
        q.transaction_id + " -> " + header.transaction_id + " total=" + util::FormatMoney(header.grand_total) + " lines=" + LineSummary(staged.lines),
        "quotation=" + std::string(model::ToString(q.status)) + " " + BalanceSnapshot(staged.customer_before), "quotation=Converted");

  trace.Enter(PipelineState::kDone);
  BACKOFFICE_LOG_INFO("quotation converted", {StringField("quotation_id", q.transaction_id), StringField("transaction_id", header.transaction_id),
                                              MoneyField("grand_total", header.grand_total)});
  return {header.transaction_id, header.grand_total, header.total_cost};
}

} // namespace backoffice::sales
