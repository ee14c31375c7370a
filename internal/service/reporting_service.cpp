#include "reporting_service.hpp"

#include "internal/query/query_service.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace backoffice::service {

ReportingService::ReportingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::ListSalesResponse ReportingService::ListSales(const v1::ListSalesRequest& req) {
  return ObserveRpc("ReportingService.ListSales", "", [&] {
    const std::size_t limit = req.limit() == 0 ? query::QueryService::kDefaultRecentSales : req.limit();
    const auto        sales = ctx_.query->RecentSales(limit);

    v1::ListSalesResponse resp;
    for (const auto& summary : *sales) {
      Fill(resp.add_sales(), summary);
    }
    return resp;
  });
}

v1::GetSaleResponse ReportingService::GetSale(const v1::GetSaleRequest& req) {
  return ObserveRpc("ReportingService.GetSale", req.transaction_id(), [&] {
    const auto record = ctx_.query->SaleDetail(req.transaction_id());

    v1::GetSaleResponse resp;
    Fill(&resp, *record);
    return resp;
  });
}

v1::GetInventoryResponse ReportingService::GetInventory(const v1::GetInventoryRequest&) {
  return ObserveRpc("ReportingService.GetInventory", "", [&] {
    const auto snapshot = ctx_.query->InventorySnapshot();

    v1::GetInventoryResponse resp;
    for (const auto& position : *snapshot) {
      Fill(resp.add_items(), position);
    }
    return resp;
  });
}

v1::ListCustomersResponse ReportingService::ListCustomers(const v1::ListCustomersRequest&) {
  return ObserveRpc("ReportingService.ListCustomers", "", [&] {
    const auto customers = ctx_.query->Customers();

    v1::ListCustomersResponse resp;
    for (const auto& customer : *customers) {
      Fill(resp.add_customers(), customer);
    }
    return resp;
  });
}

v1::ListSuppliersResponse ReportingService::ListSuppliers(const v1::ListSuppliersRequest&) {
  return ObserveRpc("ReportingService.ListSuppliers", "", [&] {
    const auto suppliers = ctx_.query->Suppliers();

    v1::ListSuppliersResponse resp;
    for (const auto& supplier : *suppliers) {
      Fill(resp.add_suppliers(), supplier);
    }
    return resp;
  });
}

v1::ListQuotationsResponse ReportingService::ListQuotations(const v1::ListQuotationsRequest&) {
  return ObserveRpc("ReportingService.ListQuotations", "", [&] {
    const auto quotations = ctx_.query->Quotations();

    v1::ListQuotationsResponse resp;
    for (const auto& quotation : *quotations) {
      Fill(resp.add_quotations(), quotation);
    }
    return resp;
  });
}

v1::GetDashboardResponse ReportingService::GetDashboard(const v1::GetDashboardRequest&) {
  return ObserveRpc("ReportingService.GetDashboard", "", [&] {
    const auto summary = ctx_.query->Dashboard();

    v1::GetDashboardResponse resp;
    resp.set_date(summary->date);
    resp.set_sales_count(summary->sales_count);
    resp.set_revenue_cents(summary->revenue);
    resp.set_cogs_cents(summary->cogs);
    resp.set_gross_profit_cents(summary->gross_profit);
    resp.set_receivables_cents(summary->receivables);
    resp.set_low_stock_count(summary->low_stock_count);
    resp.set_pending_quotations(summary->pending_quotations);
    resp.set_stock_value_cents(summary->stock_value);
    resp.set_currency(ctx_.shop.currency);
    return resp;
  });
}

v1::RefreshDataResponse ReportingService::RefreshData(const v1::RefreshDataRequest& req) {
  return ObserveRpc("ReportingService.RefreshData", v1::DataDomain_Name(req.domain()), [&] {
    const auto report = ctx_.query->ForceRefreshData(FromProto(req.domain()));

    v1::RefreshDataResponse resp;
    resp.set_domain(ToProto(report.domain));
    resp.set_records(report.records);
    *resp.mutable_refreshed_at() = util::ToProto(util::Now());
    return resp;
  });
}

} // namespace backoffice::service
