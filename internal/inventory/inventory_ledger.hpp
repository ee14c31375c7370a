#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/db/api/record_store.hpp"
#include "internal/inventory/stock_stage.hpp"
#include "internal/lock/mutation_lock.hpp"
#include "internal/sequence/sequence_allocator.hpp"
#include "internal/util/time.hpp"

namespace backoffice::inventory {

/*
  Per-item stock held as FIFO cost batches.

  Mutations take the mutation lock guard and go through a StockStage;
  Apply writes the stage during the persist step. Reads are lock-free and
  see committed rows only.
*/
class InventoryLedger {
 public:
  InventoryLedger(db::RecordStore& store, sequence::SequenceAllocator& sequences, util::NowFn now = util::Now);

  // Takes `qty` units oldest batch first. Throws util::InsufficientStock and
  // leaves the item's staged state untouched when not enough is available.
  ConsumptionResult Consume(const lock::Guard& guard, StockStage& stage, const std::string& item_id, std::int64_t qty);

  // Re-credits exactly the batches and quantities in `takes`. Returns the
  // cost value restored.
  util::Cents Restore(const lock::Guard& guard, StockStage& stage, const std::string& item_id, const std::vector<model::BatchTake>& takes);

  // Adds a synthetic batch at `unit_cost`. `fallback` marks use for a sale
  // line without a recorded breakdown and logs a warning.
  model::BatchTake RestoreAtCost(const lock::Guard& guard, StockStage& stage, const std::string& item_id, std::int64_t qty, util::Cents unit_cost,
                                 model::BatchSource source, const std::string& reference_id, bool fallback);

  // Appends a new batch and records the item's last cost. Returns the batch id.
  std::string Receive(const lock::Guard& guard, StockStage& stage, const std::string& item_id, std::int64_t qty, util::Cents unit_cost,
                      model::BatchSource source, const std::string& reference_id);

  // Writes the stage. Throws util::StoreWriteFailure.
  void Apply(const StockStage& stage);

  std::int64_t                    StockLevel(const std::string& item_id) const;
  std::vector<model::StockBatch>  Batches(const std::string& item_id) const;
  std::map<std::string, std::vector<model::StockBatch>> BatchesByItem() const;

  // Sorts oldest first: received_at_ms, then batch number.
  static void SortFifo(std::vector<model::StockBatch>& batches);

 private:
  std::vector<StagedBatch>& WorkingSet(StockStage& stage, const std::string& item_id);
  model::StockBatch         NewBatch(const lock::Guard& guard, const std::string& item_id, std::int64_t qty, util::Cents unit_cost,
                                     model::BatchSource source, const std::string& reference_id);

  db::RecordStore&             store_;
  sequence::SequenceAllocator& sequences_;
  util::NowFn                  now_;
};

} // namespace backoffice::inventory
