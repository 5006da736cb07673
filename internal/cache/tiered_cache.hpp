#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cache_layer.hpp"

namespace roadcast::cache {

struct LayerCounters {
  std::uint64_t hits   = 0;
  std::uint64_t misses = 0;
  std::uint64_t errors = 0;
  std::uint64_t writes = 0;
};

struct TieredCacheStats {
  LayerCounters fast;
  LayerCounters durable;
  std::uint64_t backfills      = 0;
  std::uint64_t degraded_reads = 0;
};

/*
  TieredCache

  Read path:  fast -> durable -> absent. A durable hit is copied back into
  the fast tier with ttl = min(time left, max_backfill_ttl).

  Layer failures (util::CacheLayerDown) are logged and counted here and never
  leave this class. With both tiers down, reads report absent and writes are
  dropped, so callers fall through to origin without caching.
*/
class TieredCache {
 public:
  TieredCache(std::shared_ptr<CacheLayer> fast, std::shared_ptr<CacheLayer> durable, std::chrono::milliseconds max_backfill_ttl);

  // Fresh entries only.
  std::optional<CacheEntry> Get(const std::string& key);

  // An expired entry no older than grace past its expiry, durable tier only.
  std::optional<CacheEntry> GetStale(const std::string& key, std::chrono::milliseconds grace);

  // Throws util::Invalid when entry.expires_at <= entry.created_at.
  // fast_ttl <= 0 skips the fast tier.
  void Put(const CacheEntry& entry, std::chrono::milliseconds fast_ttl, bool persist_durable);

  // Removes the key from both tiers; true if either held it.
  bool Invalidate(const std::string& key);

  // Drops entries whose expiry is at or before cutoff from both tiers.
  std::uint64_t PurgeExpired(util::TimePoint cutoff);

  TieredCacheStats Stats() const;

 private:
  struct AtomicCounters {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> errors{0};
    std::atomic<std::uint64_t> writes{0};

    LayerCounters Snapshot() const;
  };

  std::optional<CacheEntry> Lookup(CacheLayer& layer, AtomicCounters& counters, const std::string& key, bool& failed);
  void                      Backfill(const CacheEntry& entry);

  std::shared_ptr<CacheLayer> fast_;
  std::shared_ptr<CacheLayer> durable_;
  std::chrono::milliseconds   max_backfill_ttl_;

  AtomicCounters             fast_counters_;
  AtomicCounters             durable_counters_;
  std::atomic<std::uint64_t> backfills_{0};
  std::atomic<std::uint64_t> degraded_reads_{0};
};

} // namespace roadcast::cache
