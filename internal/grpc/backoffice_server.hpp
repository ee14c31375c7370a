#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "backoffice/v1/backoffice_service.grpc.pb.h"
#include "internal/service/catalog_service.hpp"
#include "internal/service/reporting_service.hpp"
#include "internal/service/sales_service.hpp"

namespace backoffice::grpc {

/*
  Thin transport adapter: every RPC delegates to a service and maps thrown
  exceptions with ToStatus.
*/
class BackOfficeServer final : public backoffice::v1::BackOfficeService::Service {
public:
  BackOfficeServer(std::shared_ptr<backoffice::service::SalesService> sales, std::shared_ptr<backoffice::service::CatalogService> catalog,
                   std::shared_ptr<backoffice::service::ReportingService> reporting);

  ::grpc::Status CreateSale(::grpc::ServerContext*, const backoffice::v1::CreateSaleRequest*, backoffice::v1::CreateSaleResponse*) override;

  ::grpc::Status CancelSale(::grpc::ServerContext*, const backoffice::v1::CancelSaleRequest*, backoffice::v1::CancelSaleResponse*) override;

  ::grpc::Status ProcessReturn(::grpc::ServerContext*, const backoffice::v1::ProcessReturnRequest*, backoffice::v1::ProcessReturnResponse*) override;

  ::grpc::Status CreateQuotation(::grpc::ServerContext*, const backoffice::v1::CreateQuotationRequest*, backoffice::v1::CreateQuotationResponse*) override;

  ::grpc::Status UpdateQuotationStatus(::grpc::ServerContext*, const backoffice::v1::UpdateQuotationStatusRequest*, backoffice::v1::UpdateQuotationStatusResponse*) override;

  ::grpc::Status DeleteQuotation(::grpc::ServerContext*, const backoffice::v1::DeleteQuotationRequest*, backoffice::v1::DeleteQuotationResponse*) override;

  ::grpc::Status ConvertQuotation(::grpc::ServerContext*, const backoffice::v1::ConvertQuotationRequest*, backoffice::v1::ConvertQuotationResponse*) override;

  ::grpc::Status AddItem(::grpc::ServerContext*, const backoffice::v1::AddItemRequest*, backoffice::v1::AddItemResponse*) override;

  ::grpc::Status AddCustomer(::grpc::ServerContext*, const backoffice::v1::AddCustomerRequest*, backoffice::v1::AddCustomerResponse*) override;

  ::grpc::Status AddSupplier(::grpc::ServerContext*, const backoffice::v1::AddSupplierRequest*, backoffice::v1::AddSupplierResponse*) override;

  ::grpc::Status ReceiveStock(::grpc::ServerContext*, const backoffice::v1::ReceiveStockRequest*, backoffice::v1::ReceiveStockResponse*) override;

  ::grpc::Status RecordPayment(::grpc::ServerContext*, const backoffice::v1::RecordPaymentRequest*, backoffice::v1::RecordPaymentResponse*) override;

  ::grpc::Status ListSales(::grpc::ServerContext*, const backoffice::v1::ListSalesRequest*, backoffice::v1::ListSalesResponse*) override;

  ::grpc::Status GetSale(::grpc::ServerContext*, const backoffice::v1::GetSaleRequest*, backoffice::v1::GetSaleResponse*) override;

  ::grpc::Status GetInventory(::grpc::ServerContext*, const backoffice::v1::GetInventoryRequest*, backoffice::v1::GetInventoryResponse*) override;

  ::grpc::Status ListCustomers(::grpc::ServerContext*, const backoffice::v1::ListCustomersRequest*, backoffice::v1::ListCustomersResponse*) override;

  ::grpc::Status ListSuppliers(::grpc::ServerContext*, const backoffice::v1::ListSuppliersRequest*, backoffice::v1::ListSuppliersResponse*) override;

  ::grpc::Status ListQuotations(::grpc::ServerContext*, const backoffice::v1::ListQuotationsRequest*, backoffice::v1::ListQuotationsResponse*) override;

  ::grpc::Status GetDashboard(::grpc::ServerContext*, const backoffice::v1::GetDashboardRequest*, backoffice::v1::GetDashboardResponse*) override;

  ::grpc::Status RefreshData(::grpc::ServerContext*, const backoffice::v1::RefreshDataRequest*, backoffice::v1::RefreshDataResponse*) override;

private:
  std::shared_ptr<backoffice::service::SalesService>     sales_service_;
  std::shared_ptr<backoffice::service::CatalogService>   catalog_service_;
  std::shared_ptr<backoffice::service::ReportingService> reporting_service_;
};

} // namespace backoffice::grpc
