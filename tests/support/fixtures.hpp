#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/audit/store_audit_sink.hpp"
#include "internal/cache/query_cache.hpp"
#include "internal/catalog/catalog_manager.hpp"
#include "internal/core/core_context.hpp"
#include "internal/db/memory/memory_record_store.hpp"
#include "internal/db/schema/collections.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/lock/mutation_lock.hpp"
#include "internal/query/query_service.hpp"
#include "internal/sales/sale_pipeline.hpp"
#include "internal/sequence/sequence_allocator.hpp"
#include "internal/util/time.hpp"

namespace backoffice::testing {

// 2026-03-02 10:00:00 UTC
inline constexpr std::int64_t kBaseMillis = 1772445600000;

/*
  Test clock; shared by copy into every component that takes a NowFn.
*/
class ManualClock {
public:
  ManualClock() : millis_(std::make_shared<std::atomic<std::int64_t>>(kBaseMillis)) {
  }

  util::NowFn Fn() const {
    auto millis = millis_;
    return [millis] { return util::FromUnixMillis(millis->load()); };
  }

  util::TimePoint Now() const {
    return util::FromUnixMillis(millis_->load());
  }

  void Advance(std::chrono::milliseconds delta) {
    millis_->fetch_add(delta.count());
  }

private:
  std::shared_ptr<std::atomic<std::int64_t>> millis_;
};

/*
  Core graph over an in-memory store with a manual clock.
*/
struct Harness {
  explicit Harness(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(500)) {
    store = std::make_shared<db::memory::MemoryRecordStore>();

    core.now       = clock.Fn();
    core.store     = store;
    core.lock      = std::make_shared<lock::MutationLock>(lock_timeout);
    core.sequences = std::make_shared<sequence::SequenceAllocator>(*core.store, *core.lock);
    core.cache     = std::make_shared<cache::QueryCache>(cache::TtlPolicy::Defaults(), core.now);
    core.inventory = std::make_shared<inventory::InventoryLedger>(*core.store, *core.sequences, core.now);
    core.audit     = std::make_shared<audit::StoreAuditSink>(*core.store, core.now);

    sales   = std::make_unique<sales::SalePipeline>(core);
    catalog = std::make_unique<catalog::CatalogManager>(core);
    query   = std::make_unique<query::QueryService>(core);
  }

  std::string AddItem(const std::string& name, util::Cents price, std::int64_t opening_qty = 0, util::Cents opening_cost = 0) {
    catalog::AddItemRequest req;
    req.name          = name;
    req.category      = "General";
    req.unit_price    = price;
    req.reorder_level = 2;
    req.opening_qty   = opening_qty;
    req.opening_cost  = opening_cost;
    req.user          = "tester";
    return catalog->AddItem(req).item_id;
  }

  std::string Receive(const std::string& item_id, std::int64_t qty, util::Cents unit_cost) {
    catalog::ReceiveStockRequest req;
    req.item_id   = item_id;
    req.qty       = qty;
    req.unit_cost = unit_cost;
    req.user      = "tester";
    return catalog->ReceiveStock(req).batch_id;
  }

  std::string AddCustomer(const std::string& name, util::Cents credit_limit = 0) {
    return catalog->AddCustomer({name, "0700000000", "", credit_limit, "tester"});
  }

  model::Customer Customer(const std::string& customer_id) {
    auto row = store->FindByKey(db::schema::kCustomers, "customer_id", customer_id);
    return model::CustomerFromRow(*row);
  }

  std::int64_t Stock(const std::string& item_id) {
    return core.inventory->StockLevel(item_id);
  }

  std::size_t Rows(const char* collection) {
    return store->Scan(collection).size();
  }

  sales::SaleResult Sell(const std::string& customer_id, const std::string& item_id, std::int64_t qty,
                         model::PaymentMode mode = model::PaymentMode::kCash) {
    sales::SaleRequest req;
    req.customer_id  = customer_id;
    req.payment_mode = mode;
    req.lines        = {{item_id, qty, std::nullopt}};
    req.user         = "cashier";
    return sales->CreateSale(req);
  }

  ManualClock                                   clock;
  std::shared_ptr<db::memory::MemoryRecordStore> store;
  core::CoreContext                             core;
  std::unique_ptr<sales::SalePipeline>          sales;
  std::unique_ptr<catalog::CatalogManager>      catalog;
  std::unique_ptr<query::QueryService>          query;
};

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

} // namespace backoffice::testing
