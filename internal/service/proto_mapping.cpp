#include "proto_mapping.hpp"

#include <map>
#include <string>

#include "internal/util/errors.hpp"

namespace backoffice::service {

model::PaymentMode FromProto(v1::PaymentMode mode) {
  switch (mode) {
    case v1::PAYMENT_MODE_CASH:
      return model::PaymentMode::kCash;
    case v1::PAYMENT_MODE_BANK:
      return model::PaymentMode::kBank;
    case v1::PAYMENT_MODE_MOBILE:
      return model::PaymentMode::kMobile;
    case v1::PAYMENT_MODE_CREDIT:
      return model::PaymentMode::kCredit;
    default:
      throw util::InvalidInput("payment mode is required");
  }
}

model::QuotationStatus FromProto(v1::QuotationStatus status) {
  switch (status) {
    case v1::QUOTATION_STATUS_DRAFT:
      return model::QuotationStatus::kDraft;
    case v1::QUOTATION_STATUS_PENDING:
      return model::QuotationStatus::kPending;
    case v1::QUOTATION_STATUS_ACCEPTED:
      return model::QuotationStatus::kAccepted;
    case v1::QUOTATION_STATUS_REJECTED:
      return model::QuotationStatus::kRejected;
    case v1::QUOTATION_STATUS_CONVERTED:
      return model::QuotationStatus::kConverted;
    case v1::QUOTATION_STATUS_DELETED:
      return model::QuotationStatus::kDeleted;
    default:
      throw util::InvalidInput("quotation status is required");
  }
}

query::DataDomain FromProto(v1::DataDomain domain) {
  switch (domain) {
    case v1::DATA_DOMAIN_INVENTORY:
      return query::DataDomain::kInventory;
    case v1::DATA_DOMAIN_CUSTOMERS:
      return query::DataDomain::kCustomers;
    case v1::DATA_DOMAIN_SUPPLIERS:
      return query::DataDomain::kSuppliers;
    case v1::DATA_DOMAIN_SALES:
      return query::DataDomain::kSales;
    case v1::DATA_DOMAIN_QUOTATIONS:
      return query::DataDomain::kQuotations;
    case v1::DATA_DOMAIN_DASHBOARD:
      return query::DataDomain::kDashboard;
    case v1::DATA_DOMAIN_ALL:
      return query::DataDomain::kAll;
    default:
      throw util::InvalidInput("data domain is required");
  }
}

v1::PaymentMode ToProto(model::PaymentMode mode) {
  switch (mode) {
    case model::PaymentMode::kCash:
      return v1::PAYMENT_MODE_CASH;
    case model::PaymentMode::kBank:
      return v1::PAYMENT_MODE_BANK;
    case model::PaymentMode::kMobile:
      return v1::PAYMENT_MODE_MOBILE;
    case model::PaymentMode::kCredit:
      return v1::PAYMENT_MODE_CREDIT;
  }
  return v1::PAYMENT_MODE_UNSPECIFIED;
}

v1::SaleStatus ToProto(model::SaleStatus status) {
  switch (status) {
    case model::SaleStatus::kCompleted:
      return v1::SALE_STATUS_COMPLETED;
    case model::SaleStatus::kCancelled:
      return v1::SALE_STATUS_CANCELLED;
    case model::SaleStatus::kPartiallyReturned:
      return v1::SALE_STATUS_PARTIALLY_RETURNED;
    case model::SaleStatus::kReturned:
      return v1::SALE_STATUS_RETURNED;
  }
  return v1::SALE_STATUS_UNSPECIFIED;
}

v1::QuotationStatus ToProto(model::QuotationStatus status) {
  switch (status) {
    case model::QuotationStatus::kDraft:
      return v1::QUOTATION_STATUS_DRAFT;
    case model::QuotationStatus::kPending:
      return v1::QUOTATION_STATUS_PENDING;
    case model::QuotationStatus::kAccepted:
      return v1::QUOTATION_STATUS_ACCEPTED;
    case model::QuotationStatus::kRejected:
      return v1::QUOTATION_STATUS_REJECTED;
    case model::QuotationStatus::kConverted:
      return v1::QUOTATION_STATUS_CONVERTED;
    case model::QuotationStatus::kDeleted:
      return v1::QUOTATION_STATUS_DELETED;
  }
  return v1::QUOTATION_STATUS_UNSPECIFIED;
}

v1::DataDomain ToProto(query::DataDomain domain) {
  switch (domain) {
    case query::DataDomain::kInventory:
      return v1::DATA_DOMAIN_INVENTORY;
    case query::DataDomain::kCustomers:
      return v1::DATA_DOMAIN_CUSTOMERS;
    case query::DataDomain::kSuppliers:
      return v1::DATA_DOMAIN_SUPPLIERS;
    case query::DataDomain::kSales:
      return v1::DATA_DOMAIN_SALES;
    case query::DataDomain::kQuotations:
      return v1::DATA_DOMAIN_QUOTATIONS;
    case query::DataDomain::kDashboard:
      return v1::DATA_DOMAIN_DASHBOARD;
    case query::DataDomain::kAll:
      return v1::DATA_DOMAIN_ALL;
  }
  return v1::DATA_DOMAIN_UNSPECIFIED;
}

std::vector<sales::LineRequest> LinesFromProto(const google::protobuf::RepeatedPtrField<v1::LineItem>& lines) {
  std::vector<sales::LineRequest> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    sales::LineRequest request;
    request.item_id = line.item_id();
    request.qty     = line.qty();
    if (line.has_unit_price_cents()) {
      request.unit_price = line.unit_price_cents();
    }
    out.push_back(std::move(request));
  }
  return out;
}

void Fill(v1::SaleSummary* out, const query::SaleSummary& summary) {
  out->set_transaction_id(summary.transaction_id);
  out->set_date_time(summary.date_time);
  out->set_customer_id(summary.customer_id);
  out->set_payment_mode(ToProto(summary.payment_mode));
  out->set_status(ToProto(summary.status));
  out->set_grand_total_cents(summary.grand_total);
  out->set_total_cost_cents(summary.total_cost);
  out->set_converted_from(summary.converted_from);
}

void Fill(v1::InventoryPosition* out, const query::InventoryPosition& position) {
  out->set_item_id(position.item_id);
  out->set_name(position.name);
  out->set_category(position.category);
  out->set_unit_price_cents(position.unit_price);
  out->set_last_cost_cents(position.last_cost);
  out->set_stock(position.stock);
  out->set_stock_value_cents(position.stock_value);
  out->set_reorder_level(position.reorder_level);
  out->set_needs_reorder(position.needs_reorder);
  out->set_status(position.status);
}

void Fill(v1::Customer* out, const model::Customer& customer) {
  out->set_customer_id(customer.customer_id);
  out->set_name(customer.name);
  out->set_phone(customer.phone);
  out->set_email(customer.email);
  out->set_credit_limit_cents(customer.credit_limit);
  out->set_current_balance_cents(customer.current_balance);
  out->set_total_purchases_cents(customer.total_purchases);
  out->set_last_purchase_date(customer.last_purchase_date);
  out->set_status(customer.status);
}

void Fill(v1::Supplier* out, const model::Supplier& supplier) {
  out->set_supplier_id(supplier.supplier_id);
  out->set_name(supplier.name);
  out->set_phone(supplier.phone);
  out->set_email(supplier.email);
  out->set_current_balance_cents(supplier.current_balance);
  out->set_status(supplier.status);
}

void Fill(v1::Quotation* out, const model::QuotationHeader& quotation) {
  out->set_transaction_id(quotation.transaction_id);
  out->set_date_time(quotation.date_time);
  out->set_customer_id(quotation.customer_id);
  out->set_status(ToProto(quotation.status));
  out->set_grand_total_cents(quotation.grand_total);
  out->set_valid_until(quotation.valid_until);
  out->set_converted_sale_id(quotation.converted_sale_id);
}

void Fill(v1::GetSaleResponse* out, const sales::SaleRecord& record) {
  const auto& header  = record.header;
  auto*       summary = out->mutable_summary();
  summary->set_transaction_id(header.transaction_id);
  summary->set_date_time(header.date_time);
  summary->set_customer_id(header.customer_id);
  summary->set_payment_mode(ToProto(header.payment_mode));
  summary->set_status(ToProto(record.effective_status));
  summary->set_grand_total_cents(header.grand_total);
  summary->set_total_cost_cents(header.total_cost);
  summary->set_converted_from(header.converted_from);

  out->set_subtotal_cents(header.subtotal);
  out->set_delivery_charge_cents(header.delivery_charge);
  out->set_discount_cents(header.discount);
  out->set_created_by(header.created_by);
  out->set_notes(header.notes);

  std::map<std::string, std::int64_t> returned_by_line;
  for (const auto& ret : record.returns) {
    returned_by_line[ret.line_id] += ret.qty;
  }

  for (const auto& line : record.lines) {
    auto* pb = out->add_lines();
    pb->set_line_id(line.line_id);
    pb->set_line_no(line.line_no);
    pb->set_item_id(line.item_id);
    pb->set_qty(line.qty);
    pb->set_unit_price_cents(line.unit_price);
    pb->set_line_total_cents(line.line_total);
    pb->set_cost_of_goods_sold_cents(line.cost_of_goods_sold);
    pb->set_batch_breakdown(model::FormatBreakdown(line.breakdown));
    const auto it = returned_by_line.find(line.line_id);
    pb->set_returned_qty(it == returned_by_line.end() ? 0 : it->second);
  }

  for (const auto& event : record.events) {
    auto* pb = out->add_history();
    pb->set_from_status(ToProto(event.from_status));
    pb->set_to_status(ToProto(event.to_status));
    pb->set_reason(event.reason);
    pb->set_changed_by(event.changed_by);
    pb->set_changed_at(event.changed_at);
  }
}

} // namespace backoffice::service
