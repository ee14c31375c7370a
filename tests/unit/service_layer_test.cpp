#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_record_store.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fixtures.hpp"

namespace {

namespace v1      = backoffice::v1;
namespace util    = backoffice::util;
namespace factory = backoffice::factory;
using backoffice::testing::ManualClock;
using backoffice::testing::Throws;

struct Shop {
  ManualClock          clock;
  factory::Application app;

  Shop() {
    backoffice::runtime::config::RuntimeConfig config;
    config.mutable_shop()->set_currency("KES");
    backoffice::config::ConfigLoader::ApplyDefaults(config);
    app = factory::Build(config, std::make_shared<backoffice::db::memory::MemoryRecordStore>(), clock.Fn());
  }

  std::string AddItem(const std::string& name, std::int64_t price, std::int64_t qty, std::int64_t cost) {
    v1::AddItemRequest req;
    req.set_name(name);
    req.set_category("General");
    req.set_unit_price_cents(price);
    req.set_reorder_level(2);
    req.set_opening_qty(qty);
    req.set_opening_cost_cents(cost);
    return app.catalog_service->AddItem(req).item_id();
  }
};

void TestSaleAndReturnThroughServices() {
  Shop       shop;
  const auto item = shop.AddItem("Rice 1kg", 1500, 10, 1000);

  v1::AddCustomerRequest customer_req;
  customer_req.set_name("Baraka");
  customer_req.set_credit_limit_cents(20000);
  const auto customer = shop.app.catalog_service->AddCustomer(customer_req).customer_id();

  v1::CreateSaleRequest sale_req;
  sale_req.set_customer_id(customer);
  sale_req.set_payment_mode(v1::PAYMENT_MODE_CREDIT);
  sale_req.set_delivery_charge_cents(200);
  auto* line = sale_req.add_lines();
  line->set_item_id(item);
  line->set_qty(4);
  line->set_unit_price_cents(1400);
  const auto sale = shop.app.sales_service->CreateSale(sale_req);
  assert(sale.transaction_id() == "SALE0001");
  assert(sale.grand_total_cents() == 4 * 1400 + 200);
  assert(sale.total_cost_cents() == 4000);

  v1::ProcessReturnRequest return_req;
  return_req.set_transaction_id(sale.transaction_id());
  return_req.set_reason("damaged");
  auto* back = return_req.add_lines();
  back->set_item_id(item);
  back->set_qty(1);
  const auto returned = shop.app.sales_service->ProcessReturn(return_req);
  // a quarter of the goods carries a quarter of the delivery charge
  assert(returned.refund_total_cents() == 1450);
  assert(returned.status() == v1::SALE_STATUS_PARTIALLY_RETURNED);

  v1::GetSaleRequest get_req;
  get_req.set_transaction_id(sale.transaction_id());
  const auto detail = shop.app.reporting_service->GetSale(get_req);
  assert(detail.summary().status() == v1::SALE_STATUS_PARTIALLY_RETURNED);
  assert(detail.summary().payment_mode() == v1::PAYMENT_MODE_CREDIT);
  assert(detail.delivery_charge_cents() == 200);
  assert(detail.lines_size() == 1);
  assert(detail.lines(0).returned_qty() == 1);
  assert(detail.history_size() == 1);

  const auto customers = shop.app.reporting_service->ListCustomers(v1::ListCustomersRequest());
  assert(customers.customers(0).current_balance_cents() == 5800 - 1450);

  v1::RecordPaymentRequest pay_req;
  pay_req.set_customer_id(customer);
  pay_req.set_amount_cents(350);
  pay_req.set_account(v1::PAYMENT_MODE_MOBILE);
  assert(shop.app.catalog_service->RecordPayment(pay_req).balance_after_cents() == 4000);
}

void TestQuotationLifecycleThroughServices() {
  Shop       shop;
  const auto item = shop.AddItem("Cement", 2000, 10, 1500);

  v1::CreateQuotationRequest quote_req;
  quote_req.set_valid_days(3);
  auto* line = quote_req.add_lines();
  line->set_item_id(item);
  line->set_qty(2);
  const auto quote = shop.app.sales_service->CreateQuotation(quote_req);
  assert(quote.valid_until() == "2026-03-05");

  v1::UpdateQuotationStatusRequest accept;
  accept.set_quotation_id(quote.transaction_id());
  accept.set_status(v1::QUOTATION_STATUS_ACCEPTED);
  shop.app.sales_service->UpdateQuotationStatus(accept);

  accept.set_status(v1::QUOTATION_STATUS_UNSPECIFIED);
  assert(Throws<util::InvalidInput>([&] { shop.app.sales_service->UpdateQuotationStatus(accept); }));

  v1::ConvertQuotationRequest convert;
  convert.set_quotation_id(quote.transaction_id());
  convert.set_payment_mode(v1::PAYMENT_MODE_CASH);
  const auto sale = shop.app.sales_service->ConvertQuotation(convert);
  assert(sale.sale_id() == "SALE0001");
  assert(sale.grand_total_cents() == 4000);

  const auto quotes = shop.app.reporting_service->ListQuotations(v1::ListQuotationsRequest());
  assert(quotes.quotations_size() == 1);
  assert(quotes.quotations(0).status() == v1::QUOTATION_STATUS_CONVERTED);
  assert(quotes.quotations(0).converted_sale_id() == "SALE0001");

  const auto sales = shop.app.reporting_service->ListSales(v1::ListSalesRequest());
  assert(sales.sales_size() == 1);
  assert(sales.sales(0).converted_from() == quote.transaction_id());
}

void TestReportsCarryShopSettings() {
  Shop       shop;
  const auto item = shop.AddItem("Soap", 300, 3, 200);

  v1::ReceiveStockRequest receive;
  receive.set_item_id(item);
  receive.set_qty(2);
  receive.set_unit_cost_cents(250);
  receive.set_payment_mode(v1::PAYMENT_MODE_CASH);
  assert(shop.app.catalog_service->ReceiveStock(receive).total_cost_cents() == 500);

  const auto inventory = shop.app.reporting_service->GetInventory(v1::GetInventoryRequest());
  assert(inventory.items_size() == 1);
  assert(inventory.items(0).stock() == 5);
  assert(inventory.items(0).stock_value_cents() == 3 * 200 + 2 * 250);
  assert(inventory.items(0).last_cost_cents() == 250);

  const auto dashboard = shop.app.reporting_service->GetDashboard(v1::GetDashboardRequest());
  assert(dashboard.currency() == "KES");
  assert(dashboard.date() == "2026-03-02");

  v1::RefreshDataRequest refresh;
  refresh.set_domain(v1::DATA_DOMAIN_INVENTORY);
  const auto report = shop.app.reporting_service->RefreshData(refresh);
  assert(report.domain() == v1::DATA_DOMAIN_INVENTORY);
  assert(report.records() == 1);
  assert(report.has_refreshed_at());

  refresh.set_domain(v1::DATA_DOMAIN_UNSPECIFIED);
  assert(Throws<util::InvalidInput>([&] { shop.app.reporting_service->RefreshData(refresh); }));
}

} // namespace

int main() {
  TestSaleAndReturnThroughServices();
  TestQuotationLifecycleThroughServices();
  TestReportsCarryShopSettings();

  std::cout << "backoffice_unit_service_layer: pass\n";
  return 0;
}
