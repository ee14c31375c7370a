#include "internal/catalog/catalog_manager.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/schema/collections.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using namespace backoffice;
using backoffice::testing::Harness;
using backoffice::testing::Throws;
namespace schema = backoffice::db::schema;

model::Supplier SupplierRow(Harness& h, const std::string& supplier_id) {
  return model::SupplierFromRow(*h.store->FindByKey(schema::kSuppliers, "supplier_id", supplier_id));
}

void TestAddItemWithOpeningStock() {
  Harness h;

  catalog::AddItemRequest req;
  req.name          = "Cooking Oil 1L";
  req.category      = "Groceries";
  req.unit_price    = 4500;
  req.reorder_level = 5;
  req.opening_qty   = 12;
  req.opening_cost  = 3800;

  const auto result = h.catalog->AddItem(req);
  assert(result.item_id == "ITEM0001");
  assert(result.batch_id == "BATCH0001");
  assert(h.Stock(result.item_id) == 12);

  const auto item = model::ItemFromRow(*h.store->FindByKey(schema::kItems, "item_id", result.item_id));
  assert(item.last_cost == 3800);
  assert(item.active());

  const auto batch = h.core.inventory->Batches(result.item_id).front();
  assert(batch.source == model::BatchSource::kOpening);

  // no opening stock, no batch
  const auto bare = h.catalog->AddItem({"Salt", "Groceries", 200, 0, 0, 0, ""});
  assert(bare.batch_id.empty());
  assert(h.Rows(schema::kStockBatches) == 1);
}

void TestItemNamesAreUnique() {
  Harness h;
  h.AddItem("Rice 1kg", 1500);

  assert(Throws<util::AlreadyExists>([&] { h.AddItem("RICE 1KG", 1600); }));
  assert(Throws<util::InvalidInput>([&] { h.AddItem("", 1600); }));
  assert(Throws<util::InvalidInput>([&] { h.AddItem("Beans", -1); }));
  assert(h.Rows(schema::kItems) == 1);
}

void TestCustomersAndSuppliers() {
  Harness h;

  assert(h.AddCustomer("Baraka", 5000) == "CUST0001");
  assert(h.AddCustomer("Amina") == "CUST0002");
  assert(Throws<util::InvalidInput>([&] { h.AddCustomer(""); }));
  assert(Throws<util::InvalidInput>([&] { h.AddCustomer("Overdrawn", -1); }));

  const auto c = h.Customer("CUST0001");
  assert(c.credit_limit == 5000);
  assert(c.current_balance == 0);

  assert(h.catalog->AddSupplier({"Mzuri Wholesale", "0733000000", "", "buyer"}) == "SUPP0001");
  assert(Throws<util::InvalidInput>([&] { h.catalog->AddSupplier({"", "", "", ""}); }));
}

void TestReceiveOnCreditRaisesSupplierBalance() {
  Harness    h;
  const auto item     = h.AddItem("Rice 1kg", 1500);
  const auto supplier = h.catalog->AddSupplier({"Mzuri Wholesale", "", "", "buyer"});
  const auto ledger   = h.Rows(schema::kLedger);

  catalog::ReceiveStockRequest req;
  req.item_id      = item;
  req.qty          = 20;
  req.unit_cost    = 1100;
  req.supplier_id  = supplier;
  req.payment_mode = model::PaymentMode::kCredit;

  const auto result = h.catalog->ReceiveStock(req);
  assert(result.total_cost == 22000);
  assert(h.Stock(item) == 20);
  assert(SupplierRow(h, supplier).current_balance == 22000);
  assert(h.Rows(schema::kLedger) == ledger);

  const auto purchase = model::PurchaseFromRow(h.store->Scan(schema::kPurchases).front());
  assert(purchase.batch_id == result.batch_id);
  assert(purchase.purchase_id == result.purchase_id);

  const auto item_row = model::ItemFromRow(*h.store->FindByKey(schema::kItems, "item_id", item));
  assert(item_row.last_cost == 1100);
}

void TestCashReceiptPaysFromLedger() {
  Harness    h;
  const auto item = h.AddItem("Rice 1kg", 1500);

  catalog::ReceiveStockRequest req;
  req.item_id   = item;
  req.qty       = 3;
  req.unit_cost = 1000;
  h.catalog->ReceiveStock(req);

  const auto entry = model::LedgerEntryFromRow(h.store->Scan(schema::kLedger).back());
  assert(entry.account == "Cash");
  assert(entry.credit == 3000);

  req.payment_mode = model::PaymentMode::kCredit;
  assert(Throws<util::InvalidInput>([&] { h.catalog->ReceiveStock(req); }));
  req.supplier_id = "SUPP0404";
  assert(Throws<util::NotFound>([&] { h.catalog->ReceiveStock(req); }));
  req.item_id = "ITEM0404";
  assert(Throws<util::NotFound>([&] { h.catalog->ReceiveStock(req); }));
  assert(h.Stock(item) == 3);
}

void TestCustomerPaymentLimits() {
  Harness    h;
  const auto item     = h.AddItem("Cement", 2000, 10, 1500);
  const auto customer = h.AddCustomer("Juma Builders", 50000);
  h.Sell(customer, item, 5, model::PaymentMode::kCredit);

  assert(Throws<util::InvalidInput>([&] { h.catalog->RecordCustomerPayment({customer, 0, model::PaymentMode::kCash, "cashier"}); }));
  assert(Throws<util::InvalidInput>([&] { h.catalog->RecordCustomerPayment({customer, 10001, model::PaymentMode::kCash, "cashier"}); }));
  assert(Throws<util::InvalidInput>([&] { h.catalog->RecordCustomerPayment({customer, 100, model::PaymentMode::kCredit, "cashier"}); }));
  assert(Throws<util::NotFound>([&] { h.catalog->RecordCustomerPayment({"CUST0404", 100, model::PaymentMode::kCash, "cashier"}); }));

  const auto paid = h.catalog->RecordCustomerPayment({customer, 4000, model::PaymentMode::kBank, "cashier"});
  assert(paid.balance_after == 6000);
  assert(h.Customer(customer).current_balance == 6000);

  const auto entry = model::LedgerEntryFromRow(*h.store->FindByKey(schema::kLedger, "entry_id", paid.entry_id));
  assert(entry.account == "Bank");
  assert(entry.debit == 4000);
  assert(entry.reference_id == customer);
}

void TestWriteFailureReleasesLock() {
  Harness h;
  h.store->InjectWriteFailure(schema::kCustomers, db::ErrorCode::IOError);

  assert(Throws<util::StoreWriteFailure>([&] { h.AddCustomer("Baraka"); }));
  assert(!h.core.lock->HeldByCurrentThread());
  assert(h.AddCustomer("Baraka") == "CUST0001");
}

} // namespace

int main() {
  TestAddItemWithOpeningStock();
  TestItemNamesAreUnique();
  TestCustomersAndSuppliers();
  TestReceiveOnCreditRaisesSupplierBalance();
  TestCashReceiptPaysFromLedger();
  TestCustomerPaymentLimits();
  TestWriteFailureReleasesLock();

  std::cout << "backoffice_unit_catalog_manager: pass\n";
  return 0;
}
