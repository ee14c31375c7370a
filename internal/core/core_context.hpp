#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/util/time.hpp"

namespace backoffice::db { class RecordStore; }
namespace backoffice::lock { class MutationLock; }
namespace backoffice::sequence { class SequenceAllocator; }
namespace backoffice::cache { class QueryCache; }
namespace backoffice::inventory { class InventoryLedger; }
namespace backoffice::audit { class AuditSink; }

namespace backoffice::core {

struct ShopSettings {
  std::string   name            = "BeiPoa";
  std::string   currency        = "USD";
  std::string   currency_symbol = "$";
  std::string   timezone        = "UTC";
  std::uint32_t quotation_valid_days = 14;
};

/*
  Dependency container shared by the pipelines and the query side.
*/
struct CoreContext {
  std::shared_ptr<backoffice::db::RecordStore>             store;
  std::shared_ptr<backoffice::lock::MutationLock>          lock;
  std::shared_ptr<backoffice::sequence::SequenceAllocator> sequences;
  std::shared_ptr<backoffice::cache::QueryCache>           cache;
  std::shared_ptr<backoffice::inventory::InventoryLedger>  inventory;
  std::shared_ptr<backoffice::audit::AuditSink>            audit;
  util::NowFn                                              now = util::Now;
  ShopSettings                                             shop;
};

} // namespace backoffice::core
