#include "internal/sales/sale_pipeline.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/schema/collections.hpp"
#include "internal/db/write_guard.hpp"
#include "internal/sales/sale_loader.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

using namespace backoffice;
using backoffice::testing::Harness;
using backoffice::testing::Throws;
using namespace std::chrono_literals;
namespace schema = backoffice::db::schema;

std::vector<model::LedgerEntry> LedgerFor(Harness& h, const std::string& reference_id) {
  std::vector<model::LedgerEntry> entries;
  for (const auto& row : h.store->Scan(schema::kLedger)) {
    auto entry = model::LedgerEntryFromRow(row);
    if (entry.reference_id == reference_id) entries.push_back(std::move(entry));
  }
  return entries;
}

void TestCashSaleConsumesFifoAndWritesEverything() {
  Harness    h;
  const auto item = h.AddItem("Rice 1kg", 1500, 5, 1000);
  h.clock.Advance(1min);
  h.Receive(item, 5, 1200);
  const auto audit_rows  = h.Rows(schema::kAuditLog);
  const auto ledger_rows = h.Rows(schema::kLedger);

  const auto sale = h.Sell("", item, 7);
  assert(sale.transaction_id == "SALE0001");
  assert(sale.grand_total == 7 * 1500);
  assert(sale.total_cost == 5 * 1000 + 2 * 1200);

  assert(h.Stock(item) == 3);
  assert(h.Rows(schema::kSales) == 1);
  assert(h.Rows(schema::kSaleItems) == 1);
  assert(h.Rows(schema::kLedger) == ledger_rows + 1);
  assert(h.Rows(schema::kAuditLog) == audit_rows + 1);

  auto record = sales::LoadSale(*h.store, sale.transaction_id);
  assert(record);
  assert(record->header.created_by == "cashier");
  assert(record->effective_status == model::SaleStatus::kCompleted);
  assert(record->lines.size() == 1);
  assert(record->lines[0].breakdown.size() == 2);
  assert(record->lines[0].cost_of_goods_sold == sale.total_cost);

  const auto ledger = LedgerFor(h, sale.transaction_id);
  assert(ledger.size() == 1);
  assert(ledger[0].account == "Cash");
  assert(ledger[0].debit == sale.grand_total);

  assert(h.Sell("", item, 1).transaction_id == "SALE0002");
}

void TestTotalsUseOverridesDeliveryAndDiscount() {
  Harness    h;
  const auto rice  = h.AddItem("Rice 1kg", 1500, 10, 1000);
  const auto sugar = h.AddItem("Sugar 1kg", 2000, 10, 1600);

  sales::SaleRequest req;
  req.payment_mode    = model::PaymentMode::kMobile;
  req.lines           = {{rice, 2, std::nullopt}, {sugar, 1, 1800}};
  req.delivery_charge = 300;
  req.discount        = 100;
  req.user            = "";

  const auto sale = h.sales->CreateSale(req);
  assert(sale.grand_total == 2 * 1500 + 1800 + 300 - 100);
  assert(sale.total_cost == 2 * 1000 + 1600);

  auto record = sales::LoadSale(*h.store, sale.transaction_id);
  assert(record->header.subtotal == 4800);
  assert(record->header.created_by == "system");
  assert(record->lines[1].unit_price == 1800);
  assert(record->lines[0].line_no == 1 && record->lines[1].line_no == 2);
}

void TestRejectedRequestsWriteNothing() {
  Harness    h;
  const auto item   = h.AddItem("Rice 1kg", 1500, 3, 1000);
  const auto writes = h.store->WriteCount();

  sales::SaleRequest empty;
  assert(Throws<util::InvalidInput>([&] { h.sales->CreateSale(empty); }));

  sales::SaleRequest zero_qty;
  zero_qty.lines = {{item, 0, std::nullopt}};
  assert(Throws<util::InvalidInput>([&] { h.sales->CreateSale(zero_qty); }));

  sales::SaleRequest big_discount;
  big_discount.lines    = {{item, 1, std::nullopt}};
  big_discount.discount = 1501;
  assert(Throws<util::InvalidInput>([&] { h.sales->CreateSale(big_discount); }));

  sales::SaleRequest anonymous_credit;
  anonymous_credit.lines        = {{item, 1, std::nullopt}};
  anonymous_credit.payment_mode = model::PaymentMode::kCredit;
  assert(Throws<util::InvalidInput>([&] { h.sales->CreateSale(anonymous_credit); }));

  assert(Throws<util::NotFound>([&] { h.Sell("", "ITEM9999", 1); }));
  assert(Throws<util::NotFound>([&] { h.Sell("CUST9999", item, 1); }));

  assert(h.store->WriteCount() == writes);
  assert(!h.core.lock->HeldByCurrentThread());
}

void TestShortfallOnLaterLineAbortsWholeSale() {
  Harness    h;
  const auto rice  = h.AddItem("Rice 1kg", 1500, 10, 1000);
  const auto sugar = h.AddItem("Sugar 1kg", 2000, 1, 1600);
  const auto writes = h.store->WriteCount();

  sales::SaleRequest req;
  req.lines = {{rice, 4, std::nullopt}, {sugar, 2, std::nullopt}};

  bool reported = false;
  try {
    h.sales->CreateSale(req);
  } catch (const util::InsufficientStock& e) {
    reported = e.item_id() == sugar && e.available() == 1;
  }
  assert(reported);
  assert(h.store->WriteCount() == writes);
  assert(h.Stock(rice) == 10);

  // no sale id was burned
  assert(h.Sell("", rice, 1).transaction_id == "SALE0001");
}

void TestCreditSaleRespectsLimit() {
  Harness    h;
  const auto item     = h.AddItem("Cement", 2000, 10, 1500);
  const auto customer = h.AddCustomer("Amina Traders", 10000);

  h.Sell(customer, item, 3, model::PaymentMode::kCredit);
  auto c = h.Customer(customer);
  assert(c.current_balance == 6000);
  assert(c.total_purchases == 6000);
  assert(c.last_purchase_date == "2026-03-02");

  bool reported = false;
  try {
    h.Sell(customer, item, 3, model::PaymentMode::kCredit);
  } catch (const util::CreditLimitExceeded& e) {
    reported = e.balance() == 6000 && e.limit() == 10000 && e.amount() == 6000;
  }
  assert(reported);
  assert(h.Customer(customer).current_balance == 6000);
  assert(h.Stock(item) == 7);

  // cash sales to the same customer are not limited and leave the balance alone
  h.Sell(customer, item, 3, model::PaymentMode::kCash);
  c = h.Customer(customer);
  assert(c.current_balance == 6000);
  assert(c.total_purchases == 12000);
}

void TestCancelRestoresStockAndReversesTotals() {
  Harness    h;
  const auto item = h.AddItem("Rice 1kg", 1500, 5, 1000);
  h.clock.Advance(1min);
  h.Receive(item, 5, 1200);
  const auto customer = h.AddCustomer("Baraka", 50000);
  const auto sale     = h.Sell(customer, item, 7, model::PaymentMode::kCredit);

  assert(Throws<util::InvalidInput>([&] { h.sales->CancelSale({sale.transaction_id, "", "manager"}); }));
  assert(Throws<util::NotFound>([&] { h.sales->CancelSale({"SALE9999", "typo", "manager"}); }));

  const auto result = h.sales->CancelSale({sale.transaction_id, "wrong customer", "manager"});
  assert(result.reversed == sale.grand_total);
  assert(result.cost_restored == sale.total_cost);

  const auto batches = h.core.inventory->Batches(item);
  assert(batches.size() == 2);
  assert(batches[0].quantity_remaining == 5);
  assert(batches[1].quantity_remaining == 5);

  const auto c = h.Customer(customer);
  assert(c.current_balance == 0);
  assert(c.total_purchases == 0);

  auto record = sales::LoadSale(*h.store, sale.transaction_id);
  assert(record->effective_status == model::SaleStatus::kCancelled);
  assert(record->events.size() == 1);
  assert(record->events[0].reason == "wrong customer");

  assert(Throws<util::InvalidState>([&] { h.sales->CancelSale({sale.transaction_id, "again", "manager"}); }));
}

void TestCancelWithoutBreakdownUsesLastCost() {
  Harness    h;
  const auto item = h.AddItem("Rice 1kg", 1500, 5, 1000);
  const auto sale = h.Sell("", item, 2);

  // rows written before batch breakdowns were recorded
  auto lines = h.store->Scan(schema::kSaleItems);
  db::RequireUpdate(h.store->UpdateByKey(schema::kSaleItems, "line_id", lines[0].at("line_id"), {{"batch_breakdown", ""}}), "clear breakdown");

  const auto result = h.sales->CancelSale({sale.transaction_id, "legacy", "manager"});
  assert(result.cost_restored == 2 * 1000);
  assert(h.Stock(item) == 5);
  assert(h.core.inventory->Batches(item).size() == 2);
}

void TestStoreFailureBeforeHeaderIsReported() {
  Harness    h;
  const auto item = h.AddItem("Rice 1kg", 1500, 5, 1000);
  const auto gen  = h.core.cache->Generation(cache::CacheFamily::kSales);

  h.store->InjectWriteFailure(schema::kSales, db::ErrorCode::IOError);
  assert(Throws<util::StoreWriteFailure>([&] { h.Sell("", item, 3); }));

  // lines landed, the header did not: the sale is not visible
  assert(h.Rows(schema::kSaleItems) == 1);
  assert(!sales::LoadSale(*h.store, "SALE0001"));
  assert(h.Stock(item) == 5);

  assert(!h.core.lock->HeldByCurrentThread());
  assert(h.core.cache->Generation(cache::CacheFamily::kSales) == gen + 1);

  // the orphaned lines keep SALE0001 out of circulation
  const auto next = h.Sell("", item, 1);
  assert(next.transaction_id == "SALE0002");
  assert(h.Stock(item) == 4);

  auto record = sales::LoadSale(*h.store, next.transaction_id);
  assert(record);
  assert(record->lines.size() == 1);
  assert(record->lines[0].qty == 1);

  const auto cancelled = h.sales->CancelSale({next.transaction_id, "void", "manager"});
  assert(cancelled.cost_restored == 1000);
  assert(h.Stock(item) == 5);
}

void TestStoreFailureAfterHeaderIsReported() {
  Harness    h;
  const auto item         = h.AddItem("Cement", 2000, 10, 1500);
  const auto customer     = h.AddCustomer("Amina Traders", 50000);
  const auto sales_gen    = h.core.cache->Generation(cache::CacheFamily::kSales);
  const auto customer_gen = h.core.cache->Generation(cache::CacheFamily::kCustomers);
  const auto ledger_rows  = h.Rows(schema::kLedger);

  // header, lines and batches land; the customer update fails
  h.store->InjectWriteFailure(schema::kCustomers, db::ErrorCode::IOError);
  assert(Throws<util::StoreWriteFailure>([&] { h.Sell(customer, item, 2, model::PaymentMode::kCredit); }));

  assert(sales::LoadSale(*h.store, "SALE0001"));
  assert(h.Stock(item) == 8);
  assert(h.Customer(customer).current_balance == 0);
  assert(h.Rows(schema::kLedger) == ledger_rows);

  assert(!h.core.lock->HeldByCurrentThread());
  assert(h.core.cache->Generation(cache::CacheFamily::kSales) == sales_gen + 1);
  assert(h.core.cache->Generation(cache::CacheFamily::kCustomers) == customer_gen + 1);

  const auto next = h.Sell(customer, item, 1, model::PaymentMode::kCredit);
  assert(next.transaction_id == "SALE0002");
  assert(h.Customer(customer).current_balance == 2000);
  assert(sales::LoadSale(*h.store, next.transaction_id)->lines.size() == 1);
  assert(LedgerFor(h, next.transaction_id).size() == 1);
}

void TestBusyWhenLockHeldElsewhere() {
  Harness    h(50ms);
  const auto item   = h.AddItem("Rice 1kg", 1500, 5, 1000);
  const auto writes = h.store->WriteCount();

  std::promise<void> held;
  std::promise<void> done;
  auto               finished = done.get_future();
  std::thread        holder([&] {
    auto guard = h.core.lock->Acquire("holder");
    held.set_value();
    finished.wait();
  });

  held.get_future().wait();
  assert(Throws<util::Busy>([&] { h.Sell("", item, 1); }));
  done.set_value();
  holder.join();

  assert(h.store->WriteCount() == writes);
  assert(h.Sell("", item, 1).transaction_id == "SALE0001");
}

} // namespace

int main() {
  TestCashSaleConsumesFifoAndWritesEverything();
  TestTotalsUseOverridesDeliveryAndDiscount();
  TestRejectedRequestsWriteNothing();
  TestShortfallOnLaterLineAbortsWholeSale();
  TestCreditSaleRespectsLimit();
  TestCancelRestoresStockAndReversesTotals();
  TestCancelWithoutBreakdownUsesLastCost();
  TestStoreFailureBeforeHeaderIsReported();
  TestStoreFailureAfterHeaderIsReported();
  TestBusyWhenLockHeldElsewhere();

  std::cout << "backoffice_unit_sale_pipeline: pass\n";
  return 0;
}
