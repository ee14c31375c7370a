#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/query_cache.hpp"
#include "internal/core/core_context.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/reporting_service.hpp"
#include "internal/service/sales_service.hpp"

namespace backoffice::factory {

/*
  Application

  Owns all long-lived objects used by the server and the CLI.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  core::CoreContext core;

  std::shared_ptr<service::SalesService>     sales_service;
  std::shared_ptr<service::CatalogService>   catalog_service;
  std::shared_ptr<service::ReportingService> reporting_service;
};

cache::TtlPolicy TtlPolicyFromConfig(const backoffice::runtime::config::CacheConfig& config);

core::ShopSettings ShopFromConfig(const backoffice::runtime::config::ShopConfig& config);

/*
  Build

  Constructs the record store and everything on top of it. The config must
  already have had ConfigLoader::ApplyDefaults applied.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
Application Build(const backoffice::runtime::config::RuntimeConfig& config);

// Same graph over a caller-supplied store; used by tests.
Application Build(const backoffice::runtime::config::RuntimeConfig& config, std::shared_ptr<db::RecordStore> store, util::NowFn now = util::Now);

} // namespace backoffice::factory
