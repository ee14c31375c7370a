#pragma once

#include "api/backoffice/v1.hpp"
#include "service_context.hpp"

namespace backoffice::service {

class SalesService {
public:
  explicit SalesService(ServiceContext ctx);

  v1::CreateSaleResponse CreateSale(const v1::CreateSaleRequest& req);

  v1::CancelSaleResponse CancelSale(const v1::CancelSaleRequest& req);

  v1::ProcessReturnResponse ProcessReturn(const v1::ProcessReturnRequest& req);

  v1::CreateQuotationResponse CreateQuotation(const v1::CreateQuotationRequest& req);

  void UpdateQuotationStatus(const v1::UpdateQuotationStatusRequest& req);

  void DeleteQuotation(const v1::DeleteQuotationRequest& req);

  v1::ConvertQuotationResponse ConvertQuotation(const v1::ConvertQuotationRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace backoffice::service
