#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/db/memory/memory_record_store.hpp"
#include "internal/db/schema/collections.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_record_store.hpp"
#include "internal/factory.hpp"

namespace {

using backoffice::db::ErrorCode;
using backoffice::db::RecordStore;
using backoffice::db::Row;
namespace schema = backoffice::db::schema;
namespace v1     = backoffice::v1;

std::int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                        name;
  std::function<std::shared_ptr<RecordStore>()>      make_store;
  std::function<bool()>                              supports_restart;
  std::function<void(std::shared_ptr<RecordStore>&)> restart;
  std::function<void()>                              cleanup;
};

Row Customer(const std::string& id, const std::string& name) {
  return {{"customer_id", id}, {"name", name}, {"credit_limit", "100.00"}, {"current_balance", "0.00"}, {"status", "Active"}};
}

void VerifyAppendFindUpdate(RecordStore& store) {
  assert(store.AppendRows(schema::kCustomers, {Customer("CUST0001", "Amina"), Customer("CUST0002", "Baraka")}));

  auto found = store.FindByKey(schema::kCustomers, "customer_id", "CUST0002");
  assert(found.has_value());
  assert(backoffice::db::Cell(*found, "name") == "Baraka");
  // unset registered columns read back as empty strings
  assert(found->count("email") == 1);
  assert(backoffice::db::Cell(*found, "email").empty());

  auto outcome = store.UpdateByKey(schema::kCustomers, "customer_id", "CUST0001", {{"current_balance", "40.00"}});
  assert(outcome.result);
  assert(backoffice::db::Cell(outcome.before, "current_balance") == "0.00");
  assert(backoffice::db::Cell(outcome.after, "current_balance") == "40.00");
  assert(backoffice::db::Cell(outcome.after, "name") == "Amina");

  assert(!store.FindByKey(schema::kCustomers, "customer_id", "CUST0404").has_value());
}

void VerifyScanKeepsInsertionOrder(RecordStore& store) {
  assert(store.AppendRows(schema::kSuppliers, {{{"supplier_id", "SUPP0010"}, {"name", "late id first"}}}));
  assert(store.AppendRows(schema::kSuppliers, {{{"supplier_id", "SUPP0002"}, {"name", "early id second"}}}));

  const auto rows = store.Scan(schema::kSuppliers);
  assert(rows.size() == 2);
  assert(backoffice::db::Cell(rows[0], "supplier_id") == "SUPP0010");
  assert(backoffice::db::Cell(rows[1], "supplier_id") == "SUPP0002");
}

void VerifyBatchIsAllOrNothing(RecordStore& store) {
  const auto before = store.Scan(schema::kItems).size();

  // second row collides with the first: nothing from the batch lands
  auto dup = store.AppendRows(schema::kItems, {{{"item_id", "ITEM0100"}, {"name", "a"}}, {{"item_id", "ITEM0100"}, {"name", "b"}}});
  assert(dup.code == ErrorCode::AlreadyExists);
  assert(store.Scan(schema::kItems).size() == before);

  assert(store.AppendRows(schema::kItems, {{{"item_id", "ITEM0101"}, {"name", "c"}}}));
  auto again = store.AppendRows(schema::kItems, {{{"item_id", "ITEM0102"}, {"name", "d"}}, {{"item_id", "ITEM0101"}, {"name", "e"}}});
  assert(again.code == ErrorCode::AlreadyExists);
  assert(!store.FindByKey(schema::kItems, "item_id", "ITEM0102").has_value());
}

void VerifyValidationErrors(RecordStore& store) {
  assert(store.AppendRows("no_such_collection", {{{"id", "x"}}}).code == ErrorCode::NotFound);
  assert(store.AppendRows(schema::kItems, {{{"item_id", "ITEM0200"}, {"colour", "red"}}}).code == ErrorCode::InvalidArgument);
  assert(store.AppendRows(schema::kItems, {{{"name", "no key"}}}).code == ErrorCode::InvalidArgument);

  assert(store.UpdateByKey(schema::kItems, "item_id", "ITEM0404", {{"name", "x"}}).result.code == ErrorCode::NotFound);
  assert(store.UpdateByKey(schema::kItems, "name", "x", {{"name", "y"}}).result.code == ErrorCode::InvalidArgument);
  assert(store.UpdateByKey(schema::kCustomers, "customer_id", "CUST0001", {{"customer_id", "CUST0009"}}).result.code == ErrorCode::InvalidArgument);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto store = backend.make_store();
  assert(store->AppendRows(schema::kLedger, {{{"entry_id", "LED0001"}, {"account", "Cash"}, {"debit", "12.50"}}}));

  backend.restart(store);

  auto found = store->FindByKey(schema::kLedger, "entry_id", "LED0001");
  assert(found.has_value());
  assert(backoffice::db::Cell(*found, "debit") == "12.50");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<backoffice::db::memory::MemoryRecordStore>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<RecordStore>&) {},
      .cleanup          = []() {},
  };
}

std::shared_ptr<RecordStore> OpenSqlite(const std::string& path) {
  backoffice::db::sqlite::SqliteOptions options;
  options.path = path;
  auto store   = std::make_shared<backoffice::db::sqlite::SqliteRecordStore>(std::make_shared<backoffice::db::sqlite::SqliteDB>(options));
  store->BootstrapSchema();
  return store;
}

BackendFactory MakeSqliteFactory(const std::string& db_path) {
  return BackendFactory{
      .name = "sqlite",
      .make_store =
          [db_path]() {
            std::filesystem::remove(db_path);
            return OpenSqlite(db_path);
          },
      .supports_restart = []() { return true; },
      .restart =
          [db_path](std::shared_ptr<RecordStore>& store) {
            store.reset();
            store = OpenSqlite(db_path);
          },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}

// A sale written through the full stack survives a reopen, and id
// allocation resumes after the persisted maximum.
void VerifySaleSurvivesReopen(const std::string& db_path) {
  std::filesystem::remove(db_path);

  backoffice::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path);
  backoffice::config::ConfigLoader::ApplyDefaults(config);

  std::string sale_id;
  std::string item_id;
  {
    auto app = backoffice::factory::Build(config);

    v1::AddItemRequest item;
    item.set_name("Lantern");
    item.set_unit_price_cents(1800);
    item.set_opening_qty(5);
    item.set_opening_cost_cents(1000);
    item_id = app.catalog_service->AddItem(item).item_id();

    v1::CreateSaleRequest sale;
    sale.set_payment_mode(v1::PAYMENT_MODE_CASH);
    auto* line = sale.add_lines();
    line->set_item_id(item_id);
    line->set_qty(2);
    sale_id = app.sales_service->CreateSale(sale).transaction_id();
    assert(sale_id == "SALE0001");
  }

  auto app = backoffice::factory::Build(config);

  v1::GetSaleRequest get;
  get.set_transaction_id(sale_id);
  const auto detail = app.reporting_service->GetSale(get);
  assert(detail.summary().grand_total_cents() == 3600);
  assert(detail.summary().total_cost_cents() == 2000);
  assert(detail.lines_size() == 1);

  const auto inventory = app.reporting_service->GetInventory({});
  assert(inventory.items_size() == 1);
  assert(inventory.items(0).stock() == 3);

  v1::CreateSaleRequest next;
  next.set_payment_mode(v1::PAYMENT_MODE_BANK);
  auto* line = next.add_lines();
  line->set_item_id(item_id);
  line->set_qty(1);
  assert(app.sales_service->CreateSale(next).transaction_id() == "SALE0002");
}

} // namespace

int main() {
  const auto sqlite_path =
      (std::filesystem::temp_directory_path() / ("backoffice_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  std::vector<BackendFactory> backends = {MakeMemoryFactory(), MakeSqliteFactory(sqlite_path)};

  for (auto& backend : backends) {
    auto store = backend.make_store();
    VerifyAppendFindUpdate(*store);
    VerifyScanKeepsInsertionOrder(*store);
    VerifyBatchIsAllOrNothing(*store);
    VerifyValidationErrors(*store);
    store.reset();

    VerifyRestartDurability(backend);
    backend.cleanup();
    std::cout << "backoffice_integration_record_store_parity[" << backend.name << "]: pass\n";
  }

  const auto app_path = sqlite_path + ".app";
  VerifySaleSurvivesReopen(app_path);
  std::filesystem::remove(app_path);
  std::filesystem::remove(app_path + "-wal");
  std::filesystem::remove(app_path + "-shm");

  std::cout << "backoffice_integration_record_store_parity: pass\n";
  return 0;
}
