#include "sale_loader.hpp"

#include <algorithm>

#include "internal/db/schema/collections.hpp"

namespace backoffice::sales {

model::SaleStatus EffectiveStatus(const model::SaleHeader& header, const std::vector<model::StatusEvent>& events) {
  return events.empty() ? header.status : events.back().to_status;
}

std::optional<SaleRecord> LoadSale(db::RecordStore& store, const std::string& transaction_id) {
  auto header_row = store.FindByKey(db::schema::kSales, "transaction_id", transaction_id);
  if (!header_row) return std::nullopt;

  SaleRecord record;
  record.header = model::SaleHeaderFromRow(*header_row);

  for (const auto& row : store.Scan(db::schema::kSaleItems)) {
    if (db::Cell(row, "transaction_id") == transaction_id) record.lines.push_back(model::SaleLineFromRow(row));
  }
  std::stable_sort(record.lines.begin(), record.lines.end(), [](const auto& a, const auto& b) { return a.line_no < b.line_no; });

  for (const auto& row : store.Scan(db::schema::kSaleStatusLog)) {
    if (db::Cell(row, "transaction_id") == transaction_id) record.events.push_back(model::StatusEventFromRow(row));
  }

  for (const auto& row : store.Scan(db::schema::kSaleReturns)) {
    if (db::Cell(row, "transaction_id") == transaction_id) record.returns.push_back(model::SaleReturnFromRow(row));
  }

  record.effective_status = EffectiveStatus(record.header, record.events);
  return record;
}

std::optional<QuotationRecord> LoadQuotation(db::RecordStore& store, const std::string& quotation_id) {
  auto header_row = store.FindByKey(db::schema::kQuotations, "transaction_id", quotation_id);
  if (!header_row) return std::nullopt;

  QuotationRecord record;
  record.header = model::QuotationHeaderFromRow(*header_row);
  for (const auto& row : store.Scan(db::schema::kQuotationItems)) {
    if (db::Cell(row, "transaction_id") == quotation_id) record.lines.push_back(model::QuotationLineFromRow(row));
  }
  std::stable_sort(record.lines.begin(), record.lines.end(), [](const auto& a, const auto& b) { return a.line_no < b.line_no; });
  return record;
}

} // namespace backoffice::sales
