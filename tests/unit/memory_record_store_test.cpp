#include "internal/db/memory/memory_record_store.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/db/schema/collections.hpp"
#include "internal/db/write_guard.hpp"
#include "internal/util/errors.hpp"

namespace {

using backoffice::db::ErrorCode;
using backoffice::db::memory::MemoryRecordStore;
namespace schema = backoffice::db::schema;

void TestInjectedWriteFailureLeavesCollectionUntouched() {
  MemoryRecordStore store;
  store.InjectWriteFailure(schema::kLedger, ErrorCode::IOError);

  auto failed = store.AppendRows(schema::kLedger, {{{"entry_id", "LED0001"}}});
  assert(failed.code == ErrorCode::IOError);
  assert(store.Scan(schema::kLedger).empty());
  assert(store.WriteCount() == 0);

  // only the configured number of writes fail
  assert(store.AppendRows(schema::kLedger, {{{"entry_id", "LED0001"}}}));
  assert(store.WriteCount() == 1);
}

void TestInjectedUpdateFailure() {
  MemoryRecordStore store;
  assert(store.AppendRows(schema::kCustomers, {{{"customer_id", "CUST0001"}, {"current_balance", "5.00"}}}));
  store.InjectWriteFailure(schema::kCustomers, ErrorCode::Busy, 2);

  assert(store.UpdateByKey(schema::kCustomers, "customer_id", "CUST0001", {{"current_balance", "1.00"}}).result.code == ErrorCode::Busy);
  assert(store.UpdateByKey(schema::kCustomers, "customer_id", "CUST0001", {{"current_balance", "1.00"}}).result.code == ErrorCode::Busy);
  assert(store.UpdateByKey(schema::kCustomers, "customer_id", "CUST0001", {{"current_balance", "1.00"}}).result);
  assert(backoffice::db::Cell(*store.FindByKey(schema::kCustomers, "customer_id", "CUST0001"), "current_balance") == "1.00");
}

void TestInjectedReadFailureThrows() {
  MemoryRecordStore store;
  store.InjectReadFailure(schema::kItems, true);

  bool threw = false;
  try {
    (void)store.Scan(schema::kItems);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  store.InjectReadFailure(schema::kItems, false);
  assert(store.Scan(schema::kItems).empty());
}

void TestRequireWriteRaisesStoreWriteFailure() {
  MemoryRecordStore store;
  store.InjectWriteFailure(schema::kSales, ErrorCode::IOError);

  bool threw = false;
  try {
    backoffice::db::RequireWrite(store.AppendRows(schema::kSales, {{{"transaction_id", "SALE0001"}}}), "append sale SALE0001");
  } catch (const backoffice::util::StoreWriteFailure& e) {
    threw = std::string(e.what()).find("SALE0001") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestInjectedWriteFailureLeavesCollectionUntouched();
  TestInjectedUpdateFailure();
  TestInjectedReadFailureThrows();
  TestRequireWriteRaisesStoreWriteFailure();

  std::cout << "backoffice_unit_memory_record_store: pass\n";
  return 0;
}
