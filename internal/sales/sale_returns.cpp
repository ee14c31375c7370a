#include <algorithm>
#include <exception>
#include <map>

#include "internal/db/schema/collections.hpp"
#include "internal/db/write_guard.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sales/sale_loader.hpp"
#include "internal/sales/sale_pipeline.hpp"
#include "internal/sequence/sequence_allocator.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::sales {

using observability::IntField;
using observability::MoneyField;
using observability::StringField;

namespace {

// What is still out with the customer from each batch of a line: the
// recorded breakdown minus what earlier returns already put back.
std::vector<model::BatchTake> NetBreakdown(const model::SaleLine& line, const std::vector<model::SaleReturn>& returns) {
  std::map<std::string, std::int64_t> returned;
  for (const auto& ret : returns) {
    if (ret.line_id != line.line_id) continue;
    for (const auto& take : ret.breakdown) {
      returned[take.batch_id] += take.qty;
    }
  }

  std::vector<model::BatchTake> net;
  for (auto take : line.breakdown) {
    auto& already = returned[take.batch_id];
    const auto used = std::min(already, take.qty);
    already -= used;
    take.qty -= used;
    if (take.qty > 0) net.push_back(take);
  }
  return net;
}

// Share of the grand total owed back once `returned` of `sold` has come
// back. Discount and delivery charge spread by line value (by quantity when
// every line was free); a complete return owes exactly the grand total.
util::Cents ProratedRefund(util::Cents grand_total, std::int64_t returned, std::int64_t sold) {
  if (sold <= 0 || returned >= sold) return grand_total;
  return static_cast<util::Cents>(static_cast<__int128>(grand_total) * returned / sold);
}

} // namespace

ReturnResult SalePipeline::ProcessReturn(const ReturnRequest& request) {
  OperationTrace trace("ProcessReturn");
  trace.SetSubject(request.transaction_id);

  if (request.transaction_id.empty()) {
    throw util::InvalidInput("transaction id is required");
  }
  if (request.lines.empty()) {
    throw util::InvalidInput("at least one return line is required");
  }
  if (request.reason.empty()) {
    throw util::InvalidInput("a return reason is required");
  }

  // merge repeated items, keeping first-seen order
  std::vector<ReturnLineRequest> wanted;
  for (const auto& line : request.lines) {
    if (line.item_id.empty() || line.qty <= 0) {
      throw util::InvalidInput("return lines need an item id and a positive quantity");
    }
    auto it = std::find_if(wanted.begin(), wanted.end(), [&](const auto& w) { return w.item_id == line.item_id; });
    if (it == wanted.end()) {
      wanted.push_back(line);
    } else {
      it->qty += line.qty;
    }
  }
  const auto user = UserOrSystem(request.user);

  auto guard = ctx_.lock->Acquire("ProcessReturn");
  trace.Enter(PipelineState::kLocked);

  auto sale = LoadSale(*ctx_.store, request.transaction_id);
  if (!sale) {
    throw util::NotFound("sale " + request.transaction_id + " not found");
  }
  const auto status = sale->effective_status;
  if (status != model::SaleStatus::kCompleted && status != model::SaleStatus::kPartiallyReturned) {
    throw util::InvalidState("sale " + request.transaction_id + " is " + std::string(model::ToString(status)) + " and accepts no returns");
  }
  const auto& header = sale->header;

  std::map<std::string, std::int64_t> returned_by_line;
  std::int64_t                        sold_total     = 0;
  std::int64_t                        returned_total = 0;
  for (const auto& ret : sale->returns) {
    returned_by_line[ret.line_id] += ret.qty;
    returned_total += ret.qty;
  }
  for (const auto& line : sale->lines) {
    sold_total += line.qty;
  }

  // weights for spreading the grand total over returned units
  const bool   by_value    = header.subtotal > 0;
  std::int64_t sold_weight = 0, returned_weight = 0;
  util::Cents  refunded    = 0;
  std::map<std::string, const model::SaleLine*> line_by_id;
  for (const auto& line : sale->lines) {
    sold_weight += by_value ? line.line_total : line.qty;
    line_by_id[line.line_id] = &line;
  }
  for (const auto& ret : sale->returns) {
    auto it = line_by_id.find(ret.line_id);
    if (it != line_by_id.end()) {
      returned_weight += by_value ? ret.qty * it->second->unit_price : ret.qty;
    }
    refunded += ret.refund_amount;
  }

  for (const auto& w : wanted) {
    std::int64_t sold = 0, back = 0;
    for (const auto& line : sale->lines) {
      if (line.item_id != w.item_id) continue;
      sold += line.qty;
      back += returned_by_line[line.line_id];
    }
    if (sold == 0) {
      throw util::InvalidInput("item " + w.item_id + " is not part of sale " + header.transaction_id);
    }
    if (w.qty > sold - back) {
      throw util::InvalidInput("cannot return " + std::to_string(w.qty) + " of item " + w.item_id + ": " + std::to_string(sold - back) +
                               " still returnable");
    }
  }

  ReturnResult                   result;
  inventory::StockStage          stage;
  std::vector<model::SaleReturn> rows;
  const auto                     now = util::FormatTimestamp(ctx_.now());

  for (const auto& w : wanted) {
    std::int64_t need = w.qty;
    for (const auto& line : sale->lines) {
      if (need == 0) break;
      if (line.item_id != w.item_id) continue;
      const auto take = std::min(need, line.qty - returned_by_line[line.line_id]);
      if (take <= 0) continue;
      need -= take;
      returned_weight += by_value ? take * line.unit_price : take;

      model::SaleReturn ret;
      ret.transaction_id = header.transaction_id;
      ret.line_id        = line.line_id;
      ret.item_id        = line.item_id;
      ret.qty            = take;
      ret.refund_amount  = std::max<util::Cents>(0, ProratedRefund(header.grand_total, returned_weight, sold_weight) - refunded);
      ret.reason         = request.reason;
      ret.created_by     = user;
      ret.created_at     = now;

      if (line.breakdown.empty()) {
        auto        item_row  = ctx_.store->FindByKey(db::schema::kItems, "item_id", line.item_id);
        util::Cents last_cost = item_row ? model::ItemFromRow(*item_row).last_cost : 0;
        ret.breakdown.push_back(
            ctx_.inventory->RestoreAtCost(guard, stage, line.item_id, take, last_cost, model::BatchSource::kReturn, header.transaction_id, true));
      } else {
        // most recently consumed batches go back first
        auto         net       = NetBreakdown(line, sale->returns);
        std::int64_t remaining = take;
        for (auto it = net.rbegin(); it != net.rend() && remaining > 0; ++it) {
          const auto qty = std::min(it->qty, remaining);
          ret.breakdown.push_back({it->batch_id, qty, it->unit_cost});
          remaining -= qty;
        }
        if (remaining > 0) {
          throw util::InvalidState("batch breakdown of line " + line.line_id + " does not cover the returned quantity");
        }
        ctx_.inventory->Restore(guard, stage, line.item_id, ret.breakdown);
      }
      for (const auto& restored : ret.breakdown) {
        ret.cost_restored += restored.qty * restored.unit_cost;
      }

      ret.return_id = ctx_.sequences->NextId(guard, sequence::EntityType::kReturn);
      result.return_ids.push_back(ret.return_id);
      refunded += ret.refund_amount;
      result.refund_total += ret.refund_amount;
      result.cost_restored += ret.cost_restored;
      returned_total += take;
      returned_by_line[line.line_id] += take;
      rows.push_back(std::move(ret));
    }
  }

  result.status = returned_total >= sold_total ? model::SaleStatus::kReturned : model::SaleStatus::kPartiallyReturned;

  std::optional<model::Customer> customer_before;
  db::Row                        customer_patch;
  if (!header.customer_id.empty()) {
    auto row = ctx_.store->FindByKey(db::schema::kCustomers, "customer_id", header.customer_id);
    if (!row) {
      throw util::NotFound("customer " + header.customer_id + " of sale " + header.transaction_id + " not found");
    }
    customer_before = model::CustomerFromRow(*row);
    customer_patch  = {{"total_purchases", util::FormatMoney(customer_before->total_purchases - result.refund_total)}};
    if (header.payment_mode == model::PaymentMode::kCredit) {
      customer_patch["current_balance"] = util::FormatMoney(customer_before->current_balance - result.refund_total);
    }
  }

  std::optional<model::LedgerEntry> refund;
  if (header.payment_mode != model::PaymentMode::kCredit) {
    refund.emplace();
    refund->entry_id     = ctx_.sequences->NextId(guard, sequence::EntityType::kLedgerEntry);
    refund->date_time    = now;
    refund->account      = std::string(model::LedgerAccount(header.payment_mode));
    refund->reference_id = header.transaction_id;
    refund->description  = "Refund for return on " + header.transaction_id + ": " + request.reason;
    refund->credit       = result.refund_total;
    refund->created_by   = user;
  }

  const auto event = MakeStatusEvent(guard, header.transaction_id, status, result.status, request.reason, user);

  trace.Enter(PipelineState::kCommitting);
  std::exception_ptr failure;
  try {
    std::vector<db::Row> return_rows;
    for (const auto& ret : rows) {
      return_rows.push_back(model::ToRow(ret));
    }
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kSaleReturns, return_rows), "append returns for " + header.transaction_id);
    ctx_.inventory->Apply(stage);
    if (customer_before) {
      db::RequireUpdate(ctx_.store->UpdateByKey(db::schema::kCustomers, "customer_id", header.customer_id, customer_patch),
                        "update customer " + header.customer_id);
    }
    if (refund) {
      db::RequireWrite(ctx_.store->AppendRows(db::schema::kLedger, {model::ToRow(*refund)}), "append refund for " + header.transaction_id);
    }
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kSaleStatusLog, {model::ToRow(event)}), "append return status of " + header.transaction_id);
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
  std::string summary;
  for (const auto& ret : rows) {
    summary += (summary.empty() ? "" : ",") + ret.item_id + "x" + std::to_string(ret.qty);
  }
  Audit(user, "ProcessReturn", header.transaction_id + " refund=" + util::FormatMoney(result.refund_total) + " lines=" + summary,
        "status=" + std::string(model::ToString(status)), "status=" + std::string(model::ToString(result.status)));

  trace.Enter(PipelineState::kDone);
  BACKOFFICE_LOG_INFO("return processed", {StringField("transaction_id", header.transaction_id), MoneyField("refund", result.refund_total),
                                           MoneyField("cost_restored", result.cost_restored),
                                           IntField("returns", static_cast<std::int64_t>(result.return_ids.size()))});
  return result;
}

} // namespace backoffice::sales
