#include "query_service.hpp"

#include <algorithm>
#include <array>
#include <map>

#include "internal/cache/query_cache.hpp"
#include "internal/db/api/record_store.hpp"
#include "internal/db/schema/collections.hpp"
#include "internal/inventory/inventory_ledger.hpp"
#include "internal/lock/mutation_lock.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace backoffice::query {

using cache::CacheFamily;
using cache::CacheKey;
using observability::IntField;
using observability::StringField;

namespace {

const CacheKey kInventoryKey{CacheFamily::kInventory, "snapshot"};
const CacheKey kCustomersKey{CacheFamily::kCustomers, "all"};
const CacheKey kSuppliersKey{CacheFamily::kSuppliers, "all"};
const CacheKey kQuotationsKey{CacheFamily::kQuotations, "all"};

CacheKey RecentSalesKey(std::size_t limit) {
  return {CacheFamily::kSales, "recent:" + std::to_string(limit)};
}

CacheKey SaleDetailKey(const std::string& id) {
  return {CacheFamily::kSales, "detail:" + id};
}

CacheKey DashboardKey(const std::string& date) {
  return {CacheFamily::kDashboard, "summary:" + date};
}

} // namespace

QueryService::QueryService(core::CoreContext ctx) : ctx_(std::move(ctx)) {
}

template <typename T, typename Loader>
std::shared_ptr<const T> QueryService::Read(const CacheKey& key, Loader&& loader, bool force) {
  if (ctx_.lock->HeldByCurrentThread()) {
    return std::make_shared<const T>(loader());
  }
  if (force) {
    return ctx_.cache->Refresh<T>(key, std::forward<Loader>(loader));
  }
  return ctx_.cache->GetOrLoad<T>(key, std::forward<Loader>(loader));
}

// ------------------------------------------------------------
// Loaders
// ------------------------------------------------------------

std::vector<SaleSummary> QueryService::LoadRecentSales(std::size_t limit) {
  std::map<std::string, model::SaleStatus> last_status;
  for (const auto& row : ctx_.store->Scan(db::schema::kSaleStatusLog)) {
    const auto event                  = model::StatusEventFromRow(row);
    last_status[event.transaction_id] = event.to_status;
  }

  std::vector<SaleSummary> summaries;
  for (const auto& row : ctx_.store->Scan(db::schema::kSales)) {
    const auto  header = model::SaleHeaderFromRow(row);
    SaleSummary summary;
    summary.transaction_id = header.transaction_id;
    summary.date_time      = header.date_time;
    summary.date_time_ms   = header.date_time_ms;
    summary.customer_id    = header.customer_id;
    summary.payment_mode   = header.payment_mode;
    auto status            = last_status.find(header.transaction_id);
    summary.status         = status == last_status.end() ? header.status : status->second;
    summary.grand_total    = header.grand_total;
    summary.total_cost     = header.total_cost;
    summary.converted_from = header.converted_from;
    summaries.push_back(std::move(summary));
  }

  // newest first; insertion order breaks ties
  std::stable_sort(summaries.begin(), summaries.end(), [](const auto& a, const auto& b) { return a.date_time_ms > b.date_time_ms; });
  if (summaries.size() > limit) summaries.resize(limit);
  return summaries;
}

std::vector<InventoryPosition> QueryService::LoadInventory() {
  const auto batches = ctx_.inventory->BatchesByItem();

  std::vector<InventoryPosition> positions;
  for (const auto& row : ctx_.store->Scan(db::schema::kItems)) {
    const auto        item = model::ItemFromRow(row);
    InventoryPosition position;
    position.item_id       = item.item_id;
    position.name          = item.name;
    position.category      = item.category;
    position.unit_price    = item.unit_price;
    position.last_cost     = item.last_cost;
    position.reorder_level = item.reorder_level;
    position.status        = item.status;
    if (auto it = batches.find(item.item_id); it != batches.end()) {
      for (const auto& batch : it->second) {
        position.stock += batch.quantity_remaining;
        position.stock_value += batch.quantity_remaining * batch.unit_cost;
      }
    }
    position.needs_reorder = item.active() && position.stock <= position.reorder_level;
    positions.push_back(std::move(position));
  }
  return positions;
}

std::vector<model::Customer> QueryService::LoadCustomers() {
  std::vector<model::Customer> customers;
  for (const auto& row : ctx_.store->Scan(db::schema::kCustomers)) {
    customers.push_back(model::CustomerFromRow(row));
  }
  return customers;
}

std::vector<model::Supplier> QueryService::LoadSuppliers() {
  std::vector<model::Supplier> suppliers;
  for (const auto& row : ctx_.store->Scan(db::schema::kSuppliers)) {
    suppliers.push_back(model::SupplierFromRow(row));
  }
  return suppliers;
}

std::vector<model::QuotationHeader> QueryService::LoadQuotations() {
  std::vector<model::QuotationHeader> quotations;
  for (const auto& row : ctx_.store->Scan(db::schema::kQuotations)) {
    auto header = model::QuotationHeaderFromRow(row);
    if (header.status == model::QuotationStatus::kDeleted) continue;
    quotations.push_back(std::move(header));
  }
  return quotations;
}

DashboardSummary QueryService::LoadDashboard() {
  DashboardSummary summary;
  summary.date = util::FormatDate(ctx_.now());

  for (const auto& sale : LoadRecentSales(static_cast<std::size_t>(-1))) {
    if (sale.date_time.compare(0, summary.date.size(), summary.date) != 0) continue;
    if (sale.status == model::SaleStatus::kCancelled) continue;
    ++summary.sales_count;
    summary.revenue += sale.grand_total;
    summary.cogs += sale.total_cost;
  }
  // refunds of today's returns reduce revenue and cost
  for (const auto& row : ctx_.store->Scan(db::schema::kSaleReturns)) {
    const auto ret = model::SaleReturnFromRow(row);
    if (ret.created_at.compare(0, summary.date.size(), summary.date) != 0) continue;
    summary.revenue -= ret.refund_amount;
    summary.cogs -= ret.cost_restored;
  }
  summary.gross_profit = summary.revenue - summary.cogs;

  for (const auto& customer : LoadCustomers()) {
    summary.receivables += customer.current_balance;
  }
  for (const auto& position : LoadInventory()) {
    if (position.needs_reorder) ++summary.low_stock_count;
    summary.stock_value += position.stock_value;
  }
  for (const auto& quotation : LoadQuotations()) {
    if (quotation.status == model::QuotationStatus::kPending || quotation.status == model::QuotationStatus::kAccepted) ++summary.pending_quotations;
  }
  return summary;
}

// ------------------------------------------------------------
// Public reads
// ------------------------------------------------------------

std::shared_ptr<const std::vector<SaleSummary>> QueryService::RecentSales(std::size_t limit) {
  if (limit == 0) limit = kDefaultRecentSales;
  return Read<std::vector<SaleSummary>>(RecentSalesKey(limit), [&] { return LoadRecentSales(limit); });
}

std::shared_ptr<const sales::SaleRecord> QueryService::SaleDetail(const std::string& transaction_id) {
  if (transaction_id.empty()) {
    throw util::InvalidInput("transaction id is required");
  }
  return Read<sales::SaleRecord>(SaleDetailKey(transaction_id), [&] {
    auto record = sales::LoadSale(*ctx_.store, transaction_id);
    if (!record) throw util::NotFound("sale " + transaction_id + " not found");
    return std::move(*record);
  });
}

std::shared_ptr<const std::vector<InventoryPosition>> QueryService::InventorySnapshot() {
  return Read<std::vector<InventoryPosition>>(kInventoryKey, [&] { return LoadInventory(); });
}

std::shared_ptr<const std::vector<model::Customer>> QueryService::Customers() {
  return Read<std::vector<model::Customer>>(kCustomersKey, [&] { return LoadCustomers(); });
}

std::shared_ptr<const std::vector<model::Supplier>> QueryService::Suppliers() {
  return Read<std::vector<model::Supplier>>(kSuppliersKey, [&] { return LoadSuppliers(); });
}

std::shared_ptr<const std::vector<model::QuotationHeader>> QueryService::Quotations() {
  return Read<std::vector<model::QuotationHeader>>(kQuotationsKey, [&] { return LoadQuotations(); });
}

std::shared_ptr<const DashboardSummary> QueryService::Dashboard() {
  return Read<DashboardSummary>(DashboardKey(util::FormatDate(ctx_.now())), [&] { return LoadDashboard(); });
}

RefreshReport QueryService::ForceRefreshData(DataDomain domain) {
  RefreshReport report{domain, 0};
  const bool    all = domain == DataDomain::kAll;

  if (all) {
    // also drops per-sale detail entries
    ctx_.cache->InvalidateAll();
  } else {
    const auto purged = ctx_.cache->PurgeExpired();
    if (purged) BACKOFFICE_LOG_DEBUG("expired cache entries purged", {IntField("entries", static_cast<std::int64_t>(purged))});
  }
  if (all || domain == DataDomain::kInventory) {
    report.records += Read<std::vector<InventoryPosition>>(kInventoryKey, [&] { return LoadInventory(); }, true)->size();
  }
  if (all || domain == DataDomain::kCustomers) {
    report.records += Read<std::vector<model::Customer>>(kCustomersKey, [&] { return LoadCustomers(); }, true)->size();
  }
  if (all || domain == DataDomain::kSuppliers) {
    report.records += Read<std::vector<model::Supplier>>(kSuppliersKey, [&] { return LoadSuppliers(); }, true)->size();
  }
  if (all || domain == DataDomain::kSales) {
    if (!all) {
      const std::array families{CacheFamily::kSales};
      ctx_.cache->Invalidate(families);
    }
    report.records +=
        Read<std::vector<SaleSummary>>(RecentSalesKey(kDefaultRecentSales), [&] { return LoadRecentSales(kDefaultRecentSales); }, true)->size();
  }
  if (all || domain == DataDomain::kQuotations) {
    report.records += Read<std::vector<model::QuotationHeader>>(kQuotationsKey, [&] { return LoadQuotations(); }, true)->size();
  }
  if (all || domain == DataDomain::kDashboard) {
    Read<DashboardSummary>(DashboardKey(util::FormatDate(ctx_.now())), [&] { return LoadDashboard(); }, true);
    report.records += 1;
  }

  BACKOFFICE_LOG_INFO("cache refreshed", {StringField("domain", ToString(domain)), IntField("records", static_cast<std::int64_t>(report.records))});
  return report;
}

} // namespace backoffice::query
