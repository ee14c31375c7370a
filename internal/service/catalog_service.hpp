#pragma once

#include "api/backoffice/v1.hpp"
#include "service_context.hpp"

namespace backoffice::service {

class CatalogService {
public:
  explicit CatalogService(ServiceContext ctx);

  v1::AddItemResponse AddItem(const v1::AddItemRequest& req);

  v1::AddCustomerResponse AddCustomer(const v1::AddCustomerRequest& req);

  v1::AddSupplierResponse AddSupplier(const v1::AddSupplierRequest& req);

  v1::ReceiveStockResponse ReceiveStock(const v1::ReceiveStockRequest& req);

  v1::RecordPaymentResponse RecordPayment(const v1::RecordPaymentRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace backoffice::service
