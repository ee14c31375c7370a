#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/cache_key.hpp"
#include "internal/core/core_context.hpp"
#include "internal/query/read_models.hpp"
#include "internal/sales/sale_loader.hpp"

namespace backoffice::query {

/*
  Cached read side.

  Reads never take the mutation lock. A read issued by a thread that holds
  the lock (inside a pipeline step) bypasses the cache entirely, so values
  computed mid-mutation are never stored.
*/
class QueryService {
 public:
  static constexpr std::size_t kDefaultRecentSales = 50;

  explicit QueryService(core::CoreContext ctx);

  std::shared_ptr<const std::vector<SaleSummary>> RecentSales(std::size_t limit = kDefaultRecentSales);

  // Throws util::NotFound.
  std::shared_ptr<const sales::SaleRecord> SaleDetail(const std::string& transaction_id);

  std::shared_ptr<const std::vector<InventoryPosition>>      InventorySnapshot();
  std::shared_ptr<const std::vector<model::Customer>>        Customers();
  std::shared_ptr<const std::vector<model::Supplier>>        Suppliers();
  std::shared_ptr<const std::vector<model::QuotationHeader>> Quotations();
  std::shared_ptr<const DashboardSummary>                    Dashboard();

  // Bypasses the cache for one domain (or all) and repopulates it.
  RefreshReport ForceRefreshData(DataDomain domain);

 private:
  template <typename T, typename Loader>
  std::shared_ptr<const T> Read(const cache::CacheKey& key, Loader&& loader, bool force = false);

  std::vector<SaleSummary>             LoadRecentSales(std::size_t limit);
  std::vector<InventoryPosition>       LoadInventory();
  std::vector<model::Customer>         LoadCustomers();
  std::vector<model::Supplier>         LoadSuppliers();
  std::vector<model::QuotationHeader>  LoadQuotations();
  DashboardSummary                     LoadDashboard();

  core::CoreContext ctx_;
};

} // namespace backoffice::query
