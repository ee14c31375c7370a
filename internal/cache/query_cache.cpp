#include "query_cache.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"

namespace backoffice::cache {

using namespace std::chrono_literals;

TtlPolicy TtlPolicy::Defaults() {
  TtlPolicy policy;
  policy.ttl[static_cast<std::size_t>(CacheFamily::kInventory)]  = 3min;
  policy.ttl[static_cast<std::size_t>(CacheFamily::kCustomers)]  = 5min;
  policy.ttl[static_cast<std::size_t>(CacheFamily::kSuppliers)]  = 5min;
  policy.ttl[static_cast<std::size_t>(CacheFamily::kSales)]      = 2min;
  policy.ttl[static_cast<std::size_t>(CacheFamily::kQuotations)] = 5min;
  policy.ttl[static_cast<std::size_t>(CacheFamily::kDashboard)]  = 1min;
  policy.ttl[static_cast<std::size_t>(CacheFamily::kReference)]  = 1h;
  return policy;
}

QueryCache::QueryCache(TtlPolicy policy, util::NowFn now) : policy_(policy), now_(std::move(now)) {
}

// ------------------------------------------------------------
// Lookup / Store
// ------------------------------------------------------------

std::optional<std::any> QueryCache::Lookup(const CacheKey& key) {
  const auto rendered = key.Render();
  const auto now      = now_();
  {
    std::shared_lock lock(mutex_);
    auto             it = entries_.find(rendered);
    if (it != entries_.end() && now <= it->second.expires_at) {
      auto value = it->second.value;
      lock.unlock();
      std::unique_lock stats_lock(mutex_);
      ++stats_.hits;
      return value;
    }
  }

  std::unique_lock lock(mutex_);
  ++stats_.misses;
  auto it = entries_.find(rendered);
  if (it != entries_.end() && now > it->second.expires_at) {
    entries_.erase(it);
  }
  return std::nullopt;
}

void QueryCache::Store(const CacheKey& key, std::any value, std::optional<std::chrono::milliseconds> ttl,
                       std::optional<std::uint64_t> expected_generation) {
  const auto       expires_at = now_() + ttl.value_or(policy_.For(key.family));
  std::unique_lock lock(mutex_);

  if (expected_generation && generations_[static_cast<std::size_t>(key.family)] != *expected_generation) {
    ++stats_.dropped_stale_put;
    BACKOFFICE_LOG_DEBUG("cache put dropped after concurrent invalidation", {observability::StringField("key", key.Render())});
    return;
  }

  entries_[key.Render()] = Entry{key.family, std::move(value), expires_at};
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

void QueryCache::Invalidate(std::span<const CacheFamily> families) {
  std::unique_lock lock(mutex_);
  for (auto family : families) {
    ++generations_[static_cast<std::size_t>(family)];
  }
  std::erase_if(entries_, [&](const auto& item) {
    for (auto family : families) {
      if (item.second.family == family) return true;
    }
    return false;
  });
  ++stats_.invalidations;
}

void QueryCache::InvalidateKeys(std::span<const CacheKey> keys) {
  std::unique_lock lock(mutex_);
  for (const auto& key : keys) {
    ++generations_[static_cast<std::size_t>(key.family)];
    entries_.erase(key.Render());
  }
  ++stats_.invalidations;
}

void QueryCache::InvalidateAll() {
  std::unique_lock lock(mutex_);
  for (auto& generation : generations_) {
    ++generation;
  }
  entries_.clear();
  ++stats_.invalidations;
}

std::size_t QueryCache::PurgeExpired() {
  const auto       now = now_();
  std::unique_lock lock(mutex_);
  return std::erase_if(entries_, [&](const auto& item) { return now > item.second.expires_at; });
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

std::size_t QueryCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

std::uint64_t QueryCache::Generation(CacheFamily family) const {
  std::shared_lock lock(mutex_);
  return generations_[static_cast<std::size_t>(family)];
}

CacheStats QueryCache::Stats() const {
  std::shared_lock lock(mutex_);
  return stats_;
}

} // namespace backoffice::cache
