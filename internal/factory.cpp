#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/audit/store_audit_sink.hpp"
#include "internal/catalog/catalog_manager.hpp"
#include "internal/db/memory/memory_record_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_record_store.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/lock/mutation_lock.hpp"
#include "internal/observability/logging.hpp"
#include "internal/query/query_service.hpp"
#include "internal/sales/sale_pipeline.hpp"
#include "internal/sequence/sequence_allocator.hpp"
#include "internal/service/service_context.hpp"

namespace backoffice::factory {

using backoffice::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::RecordStore> BuildStore(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    db::sqlite::SqliteOptions options;
    options.path         = database.sqlite().path();
    options.wal_mode     = database.sqlite().wal_mode();
    options.busy_timeout = util::ParseDuration(database.sqlite().busy_timeout());

    auto store = std::make_shared<db::sqlite::SqliteRecordStore>(std::make_shared<db::sqlite::SqliteDB>(std::move(options)));
    store->BootstrapSchema();
    BACKOFFICE_LOG_INFO("Record store opened", {observability::StringField("backend", "sqlite"),
                                                 observability::StringField("path", database.sqlite().path())});
    return store;
  }

  BACKOFFICE_LOG_WARN("Record store is in memory; data is lost on exit", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRecordStore>();
}

} // namespace

cache::TtlPolicy TtlPolicyFromConfig(const backoffice::runtime::config::CacheConfig& config) {
  const auto& ttl    = config.ttl();
  auto        policy = cache::TtlPolicy::Defaults();

  const auto set = [&policy](cache::CacheFamily family, const std::string& text) {
    if (!text.empty()) {
      policy.ttl[static_cast<std::size_t>(family)] = util::ParseDuration(text);
    }
  };
  set(cache::CacheFamily::kInventory, ttl.inventory());
  set(cache::CacheFamily::kCustomers, ttl.customers());
  set(cache::CacheFamily::kSuppliers, ttl.suppliers());
  set(cache::CacheFamily::kSales, ttl.sales());
  set(cache::CacheFamily::kQuotations, ttl.quotations());
  set(cache::CacheFamily::kDashboard, ttl.dashboard());
  set(cache::CacheFamily::kReference, ttl.reference());
  return policy;
}

core::ShopSettings ShopFromConfig(const backoffice::runtime::config::ShopConfig& config) {
  core::ShopSettings shop;
  if (!config.name().empty()) shop.name = config.name();
  if (!config.currency().empty()) shop.currency = config.currency();
  if (!config.currency_symbol().empty()) shop.currency_symbol = config.currency_symbol();
  if (!config.timezone().empty()) shop.timezone = config.timezone();
  if (config.quotation_valid_days() != 0) shop.quotation_valid_days = config.quotation_valid_days();
  return shop;
}

Application Build(const RuntimeConfig& config) {
  return Build(config, BuildStore(config));
}

Application Build(const RuntimeConfig& config, std::shared_ptr<db::RecordStore> store, util::NowFn now) {
  if (!store) {
    throw std::invalid_argument("record store is required");
  }

  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto& core = app.core;
  core.now   = std::move(now);
  core.shop  = ShopFromConfig(config.shop());
  core.store = std::move(store);
  core.lock  = std::make_shared<lock::MutationLock>(util::ParseDuration(config.lock().wait_timeout()));

  const unsigned pad_width = config.sequence().pad_width() == 0 ? 4 : config.sequence().pad_width();
  core.sequences           = std::make_shared<sequence::SequenceAllocator>(*core.store, *core.lock, pad_width);
  core.cache               = std::make_shared<cache::QueryCache>(TtlPolicyFromConfig(config.cache()), core.now);
  core.inventory           = std::make_shared<inventory::InventoryLedger>(*core.store, *core.sequences, core.now);
  core.audit               = std::make_shared<audit::StoreAuditSink>(*core.store, core.now);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.sales   = std::make_shared<sales::SalePipeline>(core);
  ctx.catalog = std::make_shared<catalog::CatalogManager>(core);
  ctx.query   = std::make_shared<query::QueryService>(core);
  ctx.shop    = core.shop;

  app.sales_service     = std::make_shared<service::SalesService>(ctx);
  app.catalog_service   = std::make_shared<service::CatalogService>(ctx);
  app.reporting_service = std::make_shared<service::ReportingService>(ctx);

  BACKOFFICE_LOG_INFO("Back office ready", {observability::StringField("shop", core.shop.name), observability::StringField("currency", core.shop.currency)});
  return app;
}

} // namespace backoffice::factory
