#include "inventory_ledger.hpp"

#include <algorithm>
#include <tuple>

#include "internal/db/schema/collections.hpp"
#include "internal/db/write_guard.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::inventory {

using observability::IntField;
using observability::MoneyField;
using observability::StringField;

namespace {

void RequireGuard(const lock::Guard& guard) {
  if (!guard.Active()) {
    throw util::InvalidState("stock mutation requires the held mutation lock");
  }
}

std::int64_t BatchNumber(const std::string& batch_id) {
  return sequence::SequenceAllocator::ParseSuffix(batch_id, sequence::Info(sequence::EntityType::kBatch).prefix).value_or(0);
}

} // namespace

InventoryLedger::InventoryLedger(db::RecordStore& store, sequence::SequenceAllocator& sequences, util::NowFn now)
    : store_(store), sequences_(sequences), now_(std::move(now)) {
}

void InventoryLedger::SortFifo(std::vector<model::StockBatch>& batches) {
  std::stable_sort(batches.begin(), batches.end(), [](const model::StockBatch& a, const model::StockBatch& b) {
    return std::make_tuple(a.received_at_ms, BatchNumber(a.batch_id), a.batch_id) < std::make_tuple(b.received_at_ms, BatchNumber(b.batch_id), b.batch_id);
  });
}

std::vector<StagedBatch>& InventoryLedger::WorkingSet(StockStage& stage, const std::string& item_id) {
  auto it = stage.items.find(item_id);
  if (it != stage.items.end()) return it->second;

  std::vector<StagedBatch> staged;
  for (auto& batch : Batches(item_id)) {
    const auto remaining = batch.quantity_remaining;
    staged.push_back({std::move(batch), false, remaining});
  }
  return stage.items.emplace(item_id, std::move(staged)).first->second;
}

model::StockBatch InventoryLedger::NewBatch(const lock::Guard& guard, const std::string& item_id, std::int64_t qty, util::Cents unit_cost,
                                            model::BatchSource source, const std::string& reference_id) {
  const auto now = now_();

  model::StockBatch batch;
  batch.batch_id           = sequences_.NextId(guard, sequence::EntityType::kBatch);
  batch.item_id            = item_id;
  batch.quantity_received  = qty;
  batch.quantity_remaining = qty;
  batch.unit_cost          = unit_cost;
  batch.received_at        = util::FormatTimestamp(now);
  batch.received_at_ms     = util::ToUnixMillis(now);
  batch.source             = source;
  batch.reference_id       = reference_id;
  return batch;
}

// ------------------------------------------------------------
// Consume
// ------------------------------------------------------------

ConsumptionResult InventoryLedger::Consume(const lock::Guard& guard, StockStage& stage, const std::string& item_id, std::int64_t qty) {
  RequireGuard(guard);
  if (qty <= 0) {
    throw util::InvalidInput("quantity must be positive for item " + item_id);
  }

  auto& batches = WorkingSet(stage, item_id);

  std::int64_t available = 0;
  for (const auto& staged : batches) {
    available += staged.batch.quantity_remaining;
  }
  if (available < qty) {
    throw util::InsufficientStock(item_id, qty, available);
  }

  ConsumptionResult result;
  result.qty             = qty;
  std::int64_t remaining = qty;
  for (auto& staged : batches) {
    if (remaining == 0) break;
    auto& batch = staged.batch;
    if (batch.quantity_remaining == 0) continue;

    const auto take = std::min(batch.quantity_remaining, remaining);
    batch.quantity_remaining -= take;
    remaining -= take;
    result.cogs += take * batch.unit_cost;
    result.takes.push_back({batch.batch_id, take, batch.unit_cost});
  }

  BACKOFFICE_LOG_DEBUG("stock consumed", {StringField("item_id", item_id), IntField("qty", qty), MoneyField("cogs", result.cogs),
                                          IntField("batches", static_cast<std::int64_t>(result.takes.size()))});
  return result;
}

// ------------------------------------------------------------
// Restore
// ------------------------------------------------------------

util::Cents InventoryLedger::Restore(const lock::Guard& guard, StockStage& stage, const std::string& item_id, const std::vector<model::BatchTake>& takes) {
  RequireGuard(guard);
  auto& batches = WorkingSet(stage, item_id);

  // validate all takes before crediting any
  std::map<std::string, std::int64_t> credit;
  for (const auto& take : takes) {
    credit[take.batch_id] += take.qty;
  }
  for (const auto& [batch_id, qty] : credit) {
    auto it = std::find_if(batches.begin(), batches.end(), [&](const StagedBatch& s) { return s.batch.batch_id == batch_id; });
    if (it == batches.end()) {
      throw util::NotFound("batch " + batch_id + " of item " + item_id + " not found");
    }
    if (it->batch.quantity_remaining + qty > it->batch.quantity_received) {
      throw util::InvalidState("restoring " + std::to_string(qty) + " units to batch " + batch_id + " exceeds its received quantity");
    }
  }

  util::Cents restored = 0;
  for (const auto& take : takes) {
    auto it = std::find_if(batches.begin(), batches.end(), [&](const StagedBatch& s) { return s.batch.batch_id == take.batch_id; });
    it->batch.quantity_remaining += take.qty;
    restored += take.qty * take.unit_cost;
  }
  return restored;
}

model::BatchTake InventoryLedger::RestoreAtCost(const lock::Guard& guard, StockStage& stage, const std::string& item_id, std::int64_t qty,
                                                util::Cents unit_cost, model::BatchSource source, const std::string& reference_id, bool fallback) {
  RequireGuard(guard);
  if (qty <= 0) {
    throw util::InvalidInput("quantity must be positive for item " + item_id);
  }
  if (fallback) {
    BACKOFFICE_LOG_WARN("restoring stock without a recorded batch breakdown, using last known cost",
                        {StringField("item_id", item_id), IntField("qty", qty), MoneyField("unit_cost", unit_cost), StringField("reference_id", reference_id)});
  }

  auto& batches = WorkingSet(stage, item_id);
  auto  batch   = NewBatch(guard, item_id, qty, unit_cost, source, reference_id);
  model::BatchTake take{batch.batch_id, qty, unit_cost};
  batches.push_back({std::move(batch), true, 0});
  return take;
}

std::string InventoryLedger::Receive(const lock::Guard& guard, StockStage& stage, const std::string& item_id, std::int64_t qty, util::Cents unit_cost,
                                     model::BatchSource source, const std::string& reference_id) {
  RequireGuard(guard);
  if (qty <= 0) {
    throw util::InvalidInput("received quantity must be positive");
  }
  if (unit_cost < 0) {
    throw util::InvalidInput("unit cost must not be negative");
  }

  auto& batches  = WorkingSet(stage, item_id);
  auto  batch    = NewBatch(guard, item_id, qty, unit_cost, source, reference_id);
  auto  batch_id = batch.batch_id;
  batches.push_back({std::move(batch), true, 0});
  stage.last_cost[item_id] = unit_cost;
  return batch_id;
}

// ------------------------------------------------------------
// Apply
// ------------------------------------------------------------

void InventoryLedger::Apply(const StockStage& stage) {
  std::vector<db::Row> appends;
  for (const auto& [item_id, batches] : stage.items) {
    for (const auto& staged : batches) {
      if (staged.is_new) {
        appends.push_back(model::ToRow(staged.batch));
      } else if (staged.batch.quantity_remaining != staged.original_remaining) {
        db::RequireUpdate(store_.UpdateByKey(db::schema::kStockBatches, "batch_id", staged.batch.batch_id,
                                             {{"quantity_remaining", std::to_string(staged.batch.quantity_remaining)}}),
                          "update batch " + staged.batch.batch_id);
      }
    }
  }

  if (!appends.empty()) {
    db::RequireWrite(store_.AppendRows(db::schema::kStockBatches, appends), "append stock batches");
  }

  for (const auto& [item_id, cost] : stage.last_cost) {
    db::RequireUpdate(store_.UpdateByKey(db::schema::kItems, "item_id", item_id, {{"last_cost", util::FormatMoney(cost)}}), "update last cost of " + item_id);
  }
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::vector<model::StockBatch> InventoryLedger::Batches(const std::string& item_id) const {
  std::vector<model::StockBatch> batches;
  for (const auto& row : store_.Scan(db::schema::kStockBatches)) {
    if (db::Cell(row, "item_id") == item_id) {
      batches.push_back(model::StockBatchFromRow(row));
    }
  }
  SortFifo(batches);
  return batches;
}

std::map<std::string, std::vector<model::StockBatch>> InventoryLedger::BatchesByItem() const {
  std::map<std::string, std::vector<model::StockBatch>> by_item;
  for (const auto& row : store_.Scan(db::schema::kStockBatches)) {
    auto batch = model::StockBatchFromRow(row);
    by_item[batch.item_id].push_back(std::move(batch));
  }
  for (auto& [item_id, batches] : by_item) {
    SortFifo(batches);
  }
  return by_item;
}

std::int64_t InventoryLedger::StockLevel(const std::string& item_id) const {
  std::int64_t level = 0;
  for (const auto& batch : Batches(item_id)) {
    level += batch.quantity_remaining;
  }
  return level;
}

} // namespace backoffice::inventory
