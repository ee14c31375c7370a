#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "internal/cache/cache_key.hpp"
#include "internal/core/core_context.hpp"
#include "internal/inventory/stock_stage.hpp"
#include "internal/lock/mutation_lock.hpp"
#include "internal/model/records.hpp"
#include "internal/sales/operation_trace.hpp"

namespace backoffice::sales {

using util::Cents;

struct LineRequest {
  std::string          item_id;
  std::int64_t         qty = 0;
  std::optional<Cents> unit_price; // item's list price when unset
};

struct SaleRequest {
  std::string              customer_id;
  std::vector<LineRequest> lines;
  model::PaymentMode       payment_mode    = model::PaymentMode::kCash;
  Cents                    delivery_charge = 0;
  Cents                    discount        = 0;
  std::string              user;
  std::string              notes;
};

struct SaleResult {
  std::string transaction_id;
  Cents       grand_total = 0;
  Cents       total_cost  = 0;
};

struct CancelRequest {
  std::string transaction_id;
  std::string reason;
  std::string user;
};

struct CancelResult {
  Cents cost_restored = 0;
  Cents reversed      = 0;
};

struct ReturnLineRequest {
  std::string  item_id;
  std::int64_t qty = 0;
};

struct ReturnRequest {
  std::string                    transaction_id;
  std::vector<ReturnLineRequest> lines;
  std::string                    reason;
  std::string                    user;
};

struct ReturnResult {
  std::vector<std::string> return_ids;
  Cents                    refund_total  = 0;
  Cents                    cost_restored = 0;
  model::SaleStatus        status        = model::SaleStatus::kPartiallyReturned;
};

struct QuotationRequest {
  std::string                  customer_id;
  std::vector<LineRequest>     lines;
  Cents                        delivery_charge = 0;
  Cents                        discount        = 0;
  std::optional<std::uint32_t> valid_days; // shop default when unset
  std::string                  user;
  std::string                  notes;
};

struct QuotationResult {
  std::string transaction_id;
  Cents       grand_total = 0;
  std::string valid_until;
};

struct ConvertRequest {
  std::string        quotation_id;
  model::PaymentMode payment_mode = model::PaymentMode::kCash;
  std::string        user;
};

/*
  Sale transaction pipeline.

  Every mutation runs:
    validate (no lock) -> lock -> stage stock / check credit -> allocate ids
    -> persist -> unlock -> invalidate cache -> audit

  Business errors are raised before anything is written. A store failure
  after persist began raises util::StoreWriteFailure once the lock is
  released and the cache invalidated.
*/
class SalePipeline {
 public:
  explicit SalePipeline(core::CoreContext ctx);

  SaleResult CreateSale(const SaleRequest& request);

  CancelResult CancelSale(const CancelRequest& request);

  ReturnResult ProcessReturn(const ReturnRequest& request);

  QuotationResult CreateQuotation(const QuotationRequest& request);

  void UpdateQuotationStatus(const std::string& quotation_id, model::QuotationStatus status, const std::string& user);

  void DeleteQuotation(const std::string& quotation_id, const std::string& user);

  SaleResult ConvertQuotationToSale(const ConvertRequest& request);

 private:
  struct PricedLine {
    std::string  item_id;
    std::int64_t qty        = 0;
    Cents        unit_price = 0;
    Cents        line_total = 0;
  };

  struct PricedOrder {
    std::vector<PricedLine> lines;
    Cents                   subtotal        = 0;
    Cents                   delivery_charge = 0;
    Cents                   discount        = 0;
    Cents                   grand_total     = 0;
  };

  struct StagedSale {
    model::SaleHeader               header;
    std::vector<model::SaleLine>    lines;
    inventory::StockStage           stock;
    std::optional<model::Customer>  customer_before;
    db::Row                         customer_patch;
    model::LedgerEntry              ledger;
  };

  static void        ValidateLines(const std::vector<LineRequest>& lines, Cents delivery_charge, Cents discount);
  static std::string UserOrSystem(const std::string& user);

  PricedOrder PriceOrder(const std::vector<LineRequest>& lines, Cents delivery_charge, Cents discount);

  StagedSale StageSale(const lock::Guard& guard, OperationTrace& trace, const SaleRequest& request, const PricedOrder& order,
                       const std::string& converted_from);
  void       PersistSale(const StagedSale& staged);

  model::Customer RequireCustomer(const std::string& customer_id);

  model::StatusEvent MakeStatusEvent(const lock::Guard& guard, const std::string& transaction_id, model::SaleStatus from, model::SaleStatus to,
                                     const std::string& reason, const std::string& user);

  void InvalidateFamilies(std::span<const cache::CacheFamily> families);
  void Audit(const std::string& user, const std::string& action, const std::string& details, const std::string& before, const std::string& after);

  core::CoreContext ctx_;
};

} // namespace backoffice::sales
