#include "catalog_service.hpp"

#include "internal/catalog/catalog_manager.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace backoffice::service {

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::AddItemResponse CatalogService::AddItem(const v1::AddItemRequest& req) {
  return ObserveRpc("CatalogService.AddItem", req.name(), [&] {
    catalog::AddItemRequest request;
    request.name          = req.name();
    request.category      = req.category();
    request.unit_price    = req.unit_price_cents();
    request.reorder_level = req.reorder_level();
    request.opening_qty   = req.opening_qty();
    request.opening_cost  = req.opening_cost_cents();
    request.user          = req.user();

    const auto result = ctx_.catalog->AddItem(request);

    v1::AddItemResponse resp;
    resp.set_item_id(result.item_id);
    resp.set_batch_id(result.batch_id);
    return resp;
  });
}

v1::AddCustomerResponse CatalogService::AddCustomer(const v1::AddCustomerRequest& req) {
  return ObserveRpc("CatalogService.AddCustomer", req.name(), [&] {
    v1::AddCustomerResponse resp;
    resp.set_customer_id(ctx_.catalog->AddCustomer({req.name(), req.phone(), req.email(), req.credit_limit_cents(), req.user()}));
    return resp;
  });
}

v1::AddSupplierResponse CatalogService::AddSupplier(const v1::AddSupplierRequest& req) {
  return ObserveRpc("CatalogService.AddSupplier", req.name(), [&] {
    v1::AddSupplierResponse resp;
    resp.set_supplier_id(ctx_.catalog->AddSupplier({req.name(), req.phone(), req.email(), req.user()}));
    return resp;
  });
}

v1::ReceiveStockResponse CatalogService::ReceiveStock(const v1::ReceiveStockRequest& req) {
  return ObserveRpc("CatalogService.ReceiveStock", req.item_id(), [&] {
    catalog::ReceiveStockRequest request;
    request.item_id      = req.item_id();
    request.qty          = req.qty();
    request.unit_cost    = req.unit_cost_cents();
    request.supplier_id  = req.supplier_id();
    request.payment_mode = FromProto(req.payment_mode());
    request.user         = req.user();

    const auto result = ctx_.catalog->ReceiveStock(request);

    v1::ReceiveStockResponse resp;
    resp.set_purchase_id(result.purchase_id);
    resp.set_batch_id(result.batch_id);
    resp.set_total_cost_cents(result.total_cost);
    return resp;
  });
}

v1::RecordPaymentResponse CatalogService::RecordPayment(const v1::RecordPaymentRequest& req) {
  return ObserveRpc("CatalogService.RecordPayment", req.customer_id(), [&] {
    const auto result =
        ctx_.catalog->RecordCustomerPayment({req.customer_id(), req.amount_cents(), FromProto(req.account()), req.user()});

    v1::RecordPaymentResponse resp;
    resp.set_entry_id(result.entry_id);
    resp.set_balance_after_cents(result.balance_after);
    return resp;
  });
}

} // namespace backoffice::service
