#pragma once

#include <memory>

#include "internal/core/core_context.hpp"

namespace backoffice::sales { class SalePipeline; }
namespace backoffice::catalog { class CatalogManager; }
namespace backoffice::query { class QueryService; }

namespace backoffice::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<backoffice::sales::SalePipeline>     sales;
  std::shared_ptr<backoffice::catalog::CatalogManager> catalog;
  std::shared_ptr<backoffice::query::QueryService>     query;
  backoffice::core::ShopSettings                       shop;
};

} // namespace backoffice::service
