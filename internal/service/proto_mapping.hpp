#pragma once

#include <vector>

#include "api/backoffice/v1.hpp"
#include "internal/model/records.hpp"
#include "internal/query/read_models.hpp"
#include "internal/sales/sale_loader.hpp"
#include "internal/sales/sale_pipeline.hpp"

namespace backoffice::service {

/*
  Conversions between wire messages and domain types.

  Enum conversions from the wire throw util::InvalidInput for UNSPECIFIED
  or unknown values, so a request never falls back to a silent default.
*/

model::PaymentMode     FromProto(v1::PaymentMode mode);
model::QuotationStatus FromProto(v1::QuotationStatus status);
query::DataDomain      FromProto(v1::DataDomain domain);

v1::PaymentMode     ToProto(model::PaymentMode mode);
v1::SaleStatus      ToProto(model::SaleStatus status);
v1::QuotationStatus ToProto(model::QuotationStatus status);
v1::DataDomain      ToProto(query::DataDomain domain);

std::vector<sales::LineRequest> LinesFromProto(const google::protobuf::RepeatedPtrField<v1::LineItem>& lines);

void Fill(v1::SaleSummary* out, const query::SaleSummary& summary);
void Fill(v1::InventoryPosition* out, const query::InventoryPosition& position);
void Fill(v1::Customer* out, const model::Customer& customer);
void Fill(v1::Supplier* out, const model::Supplier& supplier);
void Fill(v1::Quotation* out, const model::QuotationHeader& quotation);
void Fill(v1::GetSaleResponse* out, const sales::SaleRecord& record);

} // namespace backoffice::service
