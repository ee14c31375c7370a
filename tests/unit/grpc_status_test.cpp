#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_record_store.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/backoffice_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1      = backoffice::v1;
namespace util    = backoffice::util;
namespace factory = backoffice::factory;

factory::Application BuildApplication() {
  backoffice::runtime::config::RuntimeConfig config;
  backoffice::config::ConfigLoader::ApplyDefaults(config);
  return factory::Build(config, std::make_shared<backoffice::db::memory::MemoryRecordStore>());
}

void TestErrorKindsMapToStatusCodes() {
  using ::grpc::StatusCode;
  assert(backoffice::grpc::ToStatus(util::InvalidInput("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(backoffice::grpc::ToStatus(util::NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(backoffice::grpc::ToStatus(util::AlreadyExists("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(backoffice::grpc::ToStatus(util::InvalidState("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(backoffice::grpc::ToStatus(util::InsufficientStock("ITEM0001", 5, 2)).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(backoffice::grpc::ToStatus(util::CreditLimitExceeded("CUST0001", 100, 500, 900)).error_code() == StatusCode::OUT_OF_RANGE);
  assert(backoffice::grpc::ToStatus(util::Busy("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(backoffice::grpc::ToStatus(util::StoreWriteFailure("x")).error_code() == StatusCode::DATA_LOSS);
  assert(backoffice::grpc::ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);
}

void TestGetMissingSaleReturnsNotFound() {
  auto                               app = BuildApplication();
  backoffice::grpc::BackOfficeServer   server(app.sales_service, app.catalog_service, app.reporting_service);
  v1::GetSaleRequest       req;
  v1::GetSaleResponse      resp;
  ::grpc::ServerContext    grpc_ctx;

  req.set_transaction_id("SALE0404");
  const auto status = server.GetSale(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestSaleBeyondStockReturnsFailedPrecondition() {
  auto                   app = BuildApplication();
  backoffice::grpc::BackOfficeServer server(app.sales_service, app.catalog_service, app.reporting_service);
  ::grpc::ServerContext  grpc_ctx;

  v1::AddItemRequest item_req;
  item_req.set_name("Kettle");
  item_req.set_unit_price_cents(2500);
  item_req.set_opening_qty(1);
  item_req.set_opening_cost_cents(1500);
  v1::AddItemResponse item_resp;
  assert(server.AddItem(&grpc_ctx, &item_req, &item_resp).ok());

  v1::CreateSaleRequest sale_req;
  sale_req.set_payment_mode(v1::PAYMENT_MODE_CASH);
  auto* line = sale_req.add_lines();
  line->set_item_id(item_resp.item_id());
  line->set_qty(3);
  v1::CreateSaleResponse sale_resp;

  const auto status = server.CreateSale(&grpc_ctx, &sale_req, &sale_resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestMissingPaymentModeReturnsInvalidArgument() {
  auto                   app = BuildApplication();
  backoffice::grpc::BackOfficeServer server(app.sales_service, app.catalog_service, app.reporting_service);
  ::grpc::ServerContext  grpc_ctx;

  v1::CreateSaleRequest sale_req;
  auto*                 line = sale_req.add_lines();
  line->set_item_id("ITEM0001");
  line->set_qty(1);
  v1::CreateSaleResponse sale_resp;

  const auto status = server.CreateSale(&grpc_ctx, &sale_req, &sale_resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestErrorKindsMapToStatusCodes();
  TestGetMissingSaleReturnsNotFound();
  TestSaleBeyondStockReturnsFailedPrecondition();
  TestMissingPaymentModeReturnsInvalidArgument();

  std::cout << "backoffice_unit_grpc_status: pass\n";
  return 0;
}
