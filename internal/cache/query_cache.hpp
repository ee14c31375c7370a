#pragma once

#include <any>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>

#include "internal/cache/cache_key.hpp"
#include "internal/util/time.hpp"

namespace backoffice::cache {

struct TtlPolicy {
  std::array<std::chrono::milliseconds, kFamilyCount> ttl;

  static TtlPolicy Defaults();

  std::chrono::milliseconds For(CacheFamily family) const {
    return ttl[static_cast<std::size_t>(family)];
  }
};

struct CacheStats {
  std::uint64_t hits              = 0;
  std::uint64_t misses            = 0;
  std::uint64_t dropped_stale_put = 0;
  std::uint64_t invalidations     = 0;
};

/*
  Read-through cache for query results.

  Values are immutable snapshots shared as shared_ptr<const T>. An entry is
  never returned after its expiry. Invalidation is synchronous and bumps a
  per-family generation; GetOrLoad drops a loaded value if its family was
  invalidated while the loader ran, so a read racing a mutation cannot
  repopulate the cache with pre-mutation data.

  Thread-safe; has its own reader/writer lock, independent of the mutation
  lock.
*/
class QueryCache {
 public:
  explicit QueryCache(TtlPolicy policy = TtlPolicy::Defaults(), util::NowFn now = util::Now);

  template <typename T>
  std::shared_ptr<const T> Get(const CacheKey& key);

  template <typename T>
  void Put(const CacheKey& key, std::shared_ptr<const T> value, std::optional<std::chrono::milliseconds> ttl = std::nullopt);

  template <typename T, typename Loader>
  std::shared_ptr<const T> GetOrLoad(const CacheKey& key, Loader&& loader);

  // Skips Get, loads and repopulates.
  template <typename T, typename Loader>
  std::shared_ptr<const T> Refresh(const CacheKey& key, Loader&& loader);

  void Invalidate(std::span<const CacheFamily> families);
  void InvalidateKeys(std::span<const CacheKey> keys);
  void InvalidateAll();

  // Removes every expired entry; returns how many were dropped.
  std::size_t PurgeExpired();

  std::size_t   Size() const;
  std::uint64_t Generation(CacheFamily family) const;
  CacheStats    Stats() const;

 private:
  struct Entry {
    CacheFamily     family;
    std::any        value;
    util::TimePoint expires_at;
  };

  std::optional<std::any> Lookup(const CacheKey& key);
  void Store(const CacheKey& key, std::any value, std::optional<std::chrono::milliseconds> ttl, std::optional<std::uint64_t> expected_generation);

  TtlPolicy   policy_;
  util::NowFn now_;

  mutable std::shared_mutex                                  mutex_;
  std::unordered_map<std::string, Entry>                     entries_;
  std::array<std::uint64_t, kFamilyCount>                    generations_{};
  CacheStats                                                 stats_;
};

// ---------------------------------------------------------------------------
// Template members
// ---------------------------------------------------------------------------

template <typename T>
std::shared_ptr<const T> QueryCache::Get(const CacheKey& key) {
  auto value = Lookup(key);
  if (!value) return nullptr;
  auto* typed = std::any_cast<std::shared_ptr<const T>>(&*value);
  return typed ? *typed : nullptr;
}

template <typename T>
void QueryCache::Put(const CacheKey& key, std::shared_ptr<const T> value, std::optional<std::chrono::milliseconds> ttl) {
  Store(key, std::any(std::move(value)), ttl, std::nullopt);
}

template <typename T, typename Loader>
std::shared_ptr<const T> QueryCache::GetOrLoad(const CacheKey& key, Loader&& loader) {
  if (auto cached = Get<T>(key)) return cached;
  return Refresh<T>(key, std::forward<Loader>(loader));
}

template <typename T, typename Loader>
std::shared_ptr<const T> QueryCache::Refresh(const CacheKey& key, Loader&& loader) {
  const auto               generation = Generation(key.family);
  std::shared_ptr<const T> value      = std::make_shared<const T>(loader());
  Store(key, std::any(value), std::nullopt, generation);
  return value;
}

} // namespace backoffice::cache
