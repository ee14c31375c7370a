#include "internal/cache/query_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "tests/support/fixtures.hpp"

namespace {

using backoffice::cache::CacheFamily;
using backoffice::cache::CacheKey;
using backoffice::cache::QueryCache;
using backoffice::cache::TtlPolicy;
using backoffice::testing::ManualClock;
using namespace std::chrono_literals;

void TestEntryNeverOutlivesTtl() {
  ManualClock clock;
  QueryCache  cache(TtlPolicy::Defaults(), clock.Fn());
  const CacheKey key{CacheFamily::kSales, "recent:50"};

  cache.Put<int>(key, std::make_shared<const int>(7));
  clock.Advance(2min);
  assert(cache.Get<int>(key) && *cache.Get<int>(key) == 7);

  clock.Advance(1ms);
  assert(!cache.Get<int>(key));
  assert(cache.Size() == 0);
}

void TestExplicitTtlOverridesFamilyDefault() {
  ManualClock clock;
  QueryCache  cache(TtlPolicy::Defaults(), clock.Fn());
  const CacheKey key{CacheFamily::kReference, "shop"};

  cache.Put<std::string>(key, std::make_shared<const std::string>("BeiPoa"), 10s);
  clock.Advance(11s);
  assert(!cache.Get<std::string>(key));
}

void TestGetOrLoadCachesUntilInvalidated() {
  ManualClock clock;
  QueryCache  cache(TtlPolicy::Defaults(), clock.Fn());
  const CacheKey key{CacheFamily::kInventory, "snapshot"};

  int loads  = 0;
  auto load  = [&] { return ++loads; };
  assert(*cache.GetOrLoad<int>(key, load) == 1);
  assert(*cache.GetOrLoad<int>(key, load) == 1);
  assert(loads == 1);

  const std::vector<CacheFamily> families = {CacheFamily::kInventory, CacheFamily::kDashboard};
  cache.Invalidate(families);
  assert(*cache.GetOrLoad<int>(key, load) == 2);

  const auto stats = cache.Stats();
  assert(stats.hits == 1);
  assert(stats.invalidations == 1);
}

void TestInvalidationOnlyTouchesNamedFamilies() {
  ManualClock clock;
  QueryCache  cache(TtlPolicy::Defaults(), clock.Fn());

  cache.Put<int>({CacheFamily::kCustomers, "all"}, std::make_shared<const int>(1));
  cache.Put<int>({CacheFamily::kSuppliers, "all"}, std::make_shared<const int>(2));

  const CacheFamily customers[] = {CacheFamily::kCustomers};
  cache.Invalidate(customers);

  assert(!cache.Get<int>({CacheFamily::kCustomers, "all"}));
  assert(cache.Get<int>({CacheFamily::kSuppliers, "all"}));
}

// A loader that ran across an invalidation must not repopulate the cache
// with what it read before the mutation.
void TestLoadRacingInvalidationIsDropped() {
  ManualClock clock;
  QueryCache  cache(TtlPolicy::Defaults(), clock.Fn());
  const CacheKey key{CacheFamily::kSales, "recent:50"};

  const CacheFamily sales[] = {CacheFamily::kSales};
  auto value = cache.Refresh<int>(key, [&] {
    cache.Invalidate(sales);
    return 41;
  });

  assert(*value == 41);
  assert(!cache.Get<int>(key));
  assert(cache.Stats().dropped_stale_put == 1);
}

void TestPurgeExpiredAndInvalidateAll() {
  ManualClock clock;
  QueryCache  cache(TtlPolicy::Defaults(), clock.Fn());

  cache.Put<int>({CacheFamily::kDashboard, "summary:2026-03-02"}, std::make_shared<const int>(1));
  cache.Put<int>({CacheFamily::kReference, "shop"}, std::make_shared<const int>(2));
  clock.Advance(90s);
  assert(cache.PurgeExpired() == 1);
  assert(cache.Size() == 1);

  const auto before = cache.Generation(CacheFamily::kReference);
  cache.InvalidateAll();
  assert(cache.Size() == 0);
  assert(cache.Generation(CacheFamily::kReference) == before + 1);
}

void TestKeysRenderWithFamilyPrefix() {
  assert((CacheKey{CacheFamily::kSales, "detail:SALE0001"}.Render() == "sales:detail:SALE0001"));
  assert((CacheKey{CacheFamily::kInventory, "snapshot"}.Render() == "inventory:snapshot"));
}

} // namespace

int main() {
  TestEntryNeverOutlivesTtl();
  TestExplicitTtlOverridesFamilyDefault();
  TestGetOrLoadCachesUntilInvalidated();
  TestInvalidationOnlyTouchesNamedFamilies();
  TestLoadRacingInvalidationIsDropped();
  TestPurgeExpiredAndInvalidateAll();
  TestKeysRenderWithFamilyPrefix();

  std::cout << "backoffice_unit_query_cache: pass\n";
  return 0;
}
