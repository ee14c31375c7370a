#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/record_store.hpp"
#include "internal/model/records.hpp"

namespace backoffice::sales {

struct SaleRecord {
  model::SaleHeader               header;
  std::vector<model::SaleLine>    lines;
  std::vector<model::StatusEvent> events;
  std::vector<model::SaleReturn>  returns;
  model::SaleStatus               effective_status = model::SaleStatus::kCompleted;
};

// The last status-log row wins; the header status applies when none exists.
model::SaleStatus EffectiveStatus(const model::SaleHeader& header, const std::vector<model::StatusEvent>& events);

// Header, lines ordered by line_no, status history and returns of one sale.
std::optional<SaleRecord> LoadSale(db::RecordStore& store, const std::string& transaction_id);

struct QuotationRecord {
  model::QuotationHeader            header;
  std::vector<model::QuotationLine> lines;
};

std::optional<QuotationRecord> LoadQuotation(db::RecordStore& store, const std::string& quotation_id);

} // namespace backoffice::sales
