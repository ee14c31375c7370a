#pragma once

#include "api/backoffice/v1.hpp"
#include "service_context.hpp"

namespace backoffice::service {

/*
  Read-only RPCs backed by the cached query side.
*/
class ReportingService {
public:
  explicit ReportingService(ServiceContext ctx);

  v1::ListSalesResponse ListSales(const v1::ListSalesRequest& req);

  v1::GetSaleResponse GetSale(const v1::GetSaleRequest& req);

  v1::GetInventoryResponse GetInventory(const v1::GetInventoryRequest& req);

  v1::ListCustomersResponse ListCustomers(const v1::ListCustomersRequest& req);

  v1::ListSuppliersResponse ListSuppliers(const v1::ListSuppliersRequest& req);

  v1::ListQuotationsResponse ListQuotations(const v1::ListQuotationsRequest& req);

  v1::GetDashboardResponse GetDashboard(const v1::GetDashboardRequest& req);

  v1::RefreshDataResponse RefreshData(const v1::RefreshDataRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace backoffice::service
