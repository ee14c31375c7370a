#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/model/records.hpp"

namespace backoffice::inventory {

struct StagedBatch {
  model::StockBatch batch;
  bool              is_new             = false;
  std::int64_t      original_remaining = 0;
};

/*
  Pending stock changes of one pipeline operation.

  Holds the working set of every item the operation touched, in FIFO order.
  Nothing reaches the store until InventoryLedger::Apply; dropping the stage
  discards everything. Later lines of the same operation see earlier lines'
  staged consumption.
*/
struct StockStage {
  std::map<std::string, std::vector<StagedBatch>> items;
  std::map<std::string, util::Cents>              last_cost;

  bool Dirty() const {
    if (!last_cost.empty()) return true;
    for (const auto& [item_id, batches] : items) {
      for (const auto& staged : batches) {
        if (staged.is_new || staged.batch.quantity_remaining != staged.original_remaining) return true;
      }
    }
    return false;
  }
};

struct ConsumptionResult {
  std::int64_t                  qty  = 0;
  util::Cents                   cogs = 0;
  std::vector<model::BatchTake> takes;
};

} // namespace backoffice::inventory
