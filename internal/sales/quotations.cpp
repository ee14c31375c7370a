#include <chrono>
#include <exception>

#include "internal/db/schema/collections.hpp"
#include "internal/db/write_guard.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sales/sale_loader.hpp"
#include "internal/sales/sale_pipeline.hpp"
#include "internal/sequence/sequence_allocator.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::sales {

using observability::MoneyField;
using observability::StringField;

// ------------------------------------------------------------
// CreateQuotation
// ------------------------------------------------------------

QuotationResult SalePipeline::CreateQuotation(const QuotationRequest& request) {
  OperationTrace trace("CreateQuotation");

  ValidateLines(request.lines, request.delivery_charge, request.discount);
  const auto valid_days = request.valid_days.value_or(ctx_.shop.quotation_valid_days);
  if (valid_days == 0) {
    throw util::InvalidInput("quotation validity must be at least one day");
  }
  const auto user = UserOrSystem(request.user);

  auto guard = ctx_.lock->Acquire("CreateQuotation");
  trace.Enter(PipelineState::kLocked);

  const auto order = PriceOrder(request.lines, request.delivery_charge, request.discount);
  if (!request.customer_id.empty()) {
    RequireCustomer(request.customer_id);
  }

  const auto now         = ctx_.now();
  const auto valid_until = now + std::chrono::hours(24) * valid_days;

  model::QuotationHeader header;
  header.transaction_id  = ctx_.sequences->NextId(guard, sequence::EntityType::kQuotation);
  header.date_time       = util::FormatTimestamp(now);
  header.customer_id     = request.customer_id;
  header.status          = model::QuotationStatus::kPending;
  header.subtotal        = order.subtotal;
  header.delivery_charge = order.delivery_charge;
  header.discount        = order.discount;
  header.grand_total     = order.grand_total;
  header.valid_until     = util::FormatDate(valid_until);
  header.valid_until_ms  = util::ToUnixMillis(valid_until);
  header.created_by      = user;
  header.notes           = request.notes;
  trace.SetSubject(header.transaction_id);

  std::vector<db::Row> line_rows;
  for (std::size_t i = 0; i < order.lines.size(); ++i) {
    model::QuotationLine line;
    line.line_id        = ctx_.sequences->NextId(guard, sequence::EntityType::kQuotationLine);
    line.transaction_id = header.transaction_id;
    line.line_no        = static_cast<std::int64_t>(i + 1);
    line.item_id        = order.lines[i].item_id;
    line.qty            = order.lines[i].qty;
    line.unit_price     = order.lines[i].unit_price;
    line.line_total     = order.lines[i].line_total;
    line_rows.push_back(model::ToRow(line));
  }

  trace.Enter(PipelineState::kCommitting);
  std::exception_ptr failure;
  try {
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kQuotationItems, line_rows), "append lines of " + header.transaction_id);
    db::RequireWrite(ctx_.store->AppendRows(db::schema::kQuotations, {model::ToRow(header)}), "append quotation " + header.transaction_id);
  } catch (const util::StoreWriteFailure&) {
    failure = std::current_exception();
  }
  guard.Release();

  trace.Enter(PipelineState::kInvalidating);
  InvalidateFamilies(cache::kQuotationInvalidations);
  if (failure) std::rethrow_exception(failure);

  trace.Enter(PipelineState::kAuditing);
  Audit(user, "CreateQuotation", header.transaction_id + " total=" + util::FormatMoney(header.grand_total) + " valid_until=" + header.valid_until, "",
        "status=Pending");

  trace.Enter(PipelineState::kDone);
  BACKOFFICE_LOG_INFO("quotation created", {StringField("quotation_id", header.transaction_id), MoneyField("grand_total", header.grand_total)});
  return {header.transaction_id, header.grand_total, header.valid_until};
}

// ------------------------------------------------------------
// Status changes
// ------------------------------------------------------------

void SalePipeline::UpdateQuotationStatus(const std::string& quotation_id, model::QuotationStatus status, const std::string& user) {
  OperationTrace trace("UpdateQuotationStatus");
  trace.SetSubject(quotation_id);

  if (quotation_id.empty()) {
    throw util::InvalidInput("quotation id is required");
  }
  if (status == model::QuotationStatus::kConverted || status == model::QuotationStatus::kDeleted) {
    throw util::InvalidInput("use conversion or deletion to set status " + std::string(model::ToString(status)));
  }

  auto guard = ctx_.lock->Acquire("UpdateQuotationStatus");
  trace.Enter(PipelineState::kLocked);

  auto row = ctx_.store->FindByKey(db::schema::kQuotations, "transaction_id", quotation_id);
  if (!row) {
    throw util::NotFound("quotation " + quotation_id + " not found");
  }
  const auto current = model::QuotationHeaderFromRow(*row).status;
  if (!model::CanTransition(current, status)) {
    throw util::InvalidState("quotation " + quotation_id + " cannot move from " + std::string(model::ToString(current)) + " to " +
                             std::string(model::ToString(status)));
  }

  trace.Enter(PipelineState::kCommitting);
  std::exception_ptr failure;
  try {
    db::RequireUpdate(ctx_.store->UpdateByKey(db::schema::kQuotations, "transaction_id", quotation_id, {{"status", std::string(model::ToString(status))}}),
                      "update quotation " + quotation_id);
  } catch (const util::StoreWriteFailure&) {
    failure = std::current_exception();
  }
  guard.Release();

  trace.Enter(PipelineState::kInvalidating);
  InvalidateFamilies(cache::kQuotationInvalidations);
  if (failure) std::rethrow_exception(failure);

  trace.Enter(PipelineState::kAuditing);
  Audit(UserOrSystem(user), "UpdateQuotationStatus", quotation_id, "status=" + std::string(model::ToString(current)),
        "status=" + std::string(model::ToString(status)));
  trace.Enter(PipelineState::kDone);
}

void SalePipeline::DeleteQuotation(const std::string& quotation_id, const std::string& user) {
  OperationTrace trace("DeleteQuotation");
  trace.SetSubject(quotation_id);

  if (quotation_id.empty()) {
    throw util::InvalidInput("quotation id is required");
  }

  auto guard = ctx_.lock->Acquire("DeleteQuotation");
  trace.Enter(PipelineState::kLocked);

  auto row = ctx_.store->FindByKey(db::schema::kQuotations, "transaction_id", quotation_id);
  if (!row) {
    throw util::NotFound("quotation " + quotation_id + " not found");
  }
  const auto header = model::QuotationHeaderFromRow(*row);
  if (header.status == model::QuotationStatus::kConverted || header.status == model::QuotationStatus::kDeleted) {
    throw util::InvalidState("quotation " + quotation_id + " is " + std::string(model::ToString(header.status)) + " and cannot be deleted");
  }

  trace.Enter(PipelineState::kCommitting);
  std::exception_ptr failure;
  try {
    db::RequireUpdate(ctx_.store->UpdateByKey(db::schema::kQuotations, "transaction_id", quotation_id,
                                              {{"status", std::string(model::ToString(model::QuotationStatus::kDeleted))}}),
                      "delete quotation " + quotation_id);
  } catch (const util::StoreWriteFailure&) {
    failure = std::current_exception();
  }
  guard.Release();

  trace.Enter(PipelineState::kInvalidating);
  InvalidateFamilies(cache::kQuotationInvalidations);
  if (failure) std::rethrow_exception(failure);

  trace.Enter(PipelineState::kAuditing);
  Audit(UserOrSystem(user), "DeleteQuotation", quotation_id, "status=" + std::string(model::ToString(header.status)), "status=Deleted");
  trace.Enter(PipelineState::kDone);
}

} // namespace backoffice::sales
