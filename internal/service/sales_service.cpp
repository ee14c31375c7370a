#include "sales_service.hpp"

#include "internal/sales/sale_pipeline.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace backoffice::service {

SalesService::SalesService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::CreateSaleResponse SalesService::CreateSale(const v1::CreateSaleRequest& req) {
  return ObserveRpc("SalesService.CreateSale", req.customer_id(), [&] {
    sales::SaleRequest request;
    request.customer_id     = req.customer_id();
    request.lines           = LinesFromProto(req.lines());
    request.payment_mode    = FromProto(req.payment_mode());
    request.delivery_charge = req.delivery_charge_cents();
    request.discount        = req.discount_cents();
    request.user            = req.user();
    request.notes           = req.notes();

    const auto result = ctx_.sales->CreateSale(request);

    v1::CreateSaleResponse resp;
    resp.set_transaction_id(result.transaction_id);
    resp.set_grand_total_cents(result.grand_total);
    resp.set_total_cost_cents(result.total_cost);
    return resp;
  });
}

v1::CancelSaleResponse SalesService::CancelSale(const v1::CancelSaleRequest& req) {
  return ObserveRpc("SalesService.CancelSale", req.transaction_id(), [&] {
    const auto result = ctx_.sales->CancelSale({req.transaction_id(), req.reason(), req.user()});

    v1::CancelSaleResponse resp;
    resp.set_cost_restored_cents(result.cost_restored);
    resp.set_reversed_cents(result.reversed);
    return resp;
  });
}

v1::ProcessReturnResponse SalesService::ProcessReturn(const v1::ProcessReturnRequest& req) {
  return ObserveRpc("SalesService.ProcessReturn", req.transaction_id(), [&] {
    sales::ReturnRequest request;
    request.transaction_id = req.transaction_id();
    request.reason         = req.reason();
    request.user           = req.user();
    for (const auto& line : req.lines()) {
      request.lines.push_back({line.item_id(), line.qty()});
    }

    const auto result = ctx_.sales->ProcessReturn(request);

    v1::ProcessReturnResponse resp;
    for (const auto& id : result.return_ids) {
      resp.add_return_ids(id);
    }
    resp.set_refund_total_cents(result.refund_total);
    resp.set_cost_restored_cents(result.cost_restored);
    resp.set_status(ToProto(result.status));
    return resp;
  });
}

v1::CreateQuotationResponse SalesService::CreateQuotation(const v1::CreateQuotationRequest& req) {
  return ObserveRpc("SalesService.CreateQuotation", req.customer_id(), [&] {
    sales::QuotationRequest request;
    request.customer_id     = req.customer_id();
    request.lines           = LinesFromProto(req.lines());
    request.delivery_charge = req.delivery_charge_cents();
    request.discount        = req.discount_cents();
    if (req.has_valid_days()) {
      request.valid_days = req.valid_days();
    }
    request.user  = req.user();
    request.notes = req.notes();

    const auto result = ctx_.sales->CreateQuotation(request);

    v1::CreateQuotationResponse resp;
    resp.set_transaction_id(result.transaction_id);
    resp.set_grand_total_cents(result.grand_total);
    resp.set_valid_until(result.valid_until);
    return resp;
  });
}

void SalesService::UpdateQuotationStatus(const v1::UpdateQuotationStatusRequest& req) {
  ObserveRpc("SalesService.UpdateQuotationStatus", req.quotation_id(),
             [&] { ctx_.sales->UpdateQuotationStatus(req.quotation_id(), FromProto(req.status()), req.user()); });
}

void SalesService::DeleteQuotation(const v1::DeleteQuotationRequest& req) {
  ObserveRpc("SalesService.DeleteQuotation", req.quotation_id(), [&] { ctx_.sales->DeleteQuotation(req.quotation_id(), req.user()); });
}

v1::ConvertQuotationResponse SalesService::ConvertQuotation(const v1::ConvertQuotationRequest& req) {
  return ObserveRpc("SalesService.ConvertQuotation", req.quotation_id(), [&] {
    const auto result = ctx_.sales->ConvertQuotationToSale({req.quotation_id(), FromProto(req.payment_mode()), req.user()});

    v1::ConvertQuotationResponse resp;
    resp.set_sale_id(result.transaction_id);
    resp.set_grand_total_cents(result.grand_total);
    return resp;
  });
}

} // namespace backoffice::service
