#include "tiered_cache.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace roadcast::cache {

using roadcast::observability::StringField;

LayerCounters TieredCache::AtomicCounters::Snapshot() const {
  LayerCounters out;
  out.hits   = hits.load();
  out.misses = misses.load();
  out.errors = errors.load();
  out.writes = writes.load();
  return out;
}

TieredCache::TieredCache(std::shared_ptr<CacheLayer> fast, std::shared_ptr<CacheLayer> durable, std::chrono::milliseconds max_backfill_ttl)
    : fast_(std::move(fast)), durable_(std::move(durable)), max_backfill_ttl_(max_backfill_ttl) {
}

std::optional<CacheEntry> TieredCache::Lookup(CacheLayer& layer, AtomicCounters& counters, const std::string& key, bool& failed) {
  auto& metrics = observability::Metrics::Instance();
  try {
    auto entry = layer.Get(key);
    if (entry && !entry->IsExpired(util::Now())) {
      counters.hits++;
      metrics.RecordCacheLookup(TierName(layer.tier()), "hit");
      return entry;
    }
    counters.misses++;
    metrics.RecordCacheLookup(TierName(layer.tier()), "miss");
  } catch (const util::CacheLayerDown& e) {
    failed = true;
    counters.errors++;
    metrics.RecordCacheLookup(TierName(layer.tier()), "error");
    ROADCAST_LOG_WARN("cache layer unavailable on read",
                      {StringField("tier", TierName(layer.tier())), StringField("key", key), StringField("error", e.what())});
  }
  return std::nullopt;
}

std::optional<CacheEntry> TieredCache::Get(const std::string& key) {
  bool fast_failed    = false;
  bool durable_failed = false;

  if (auto hit = Lookup(*fast_, fast_counters_, key, fast_failed)) {
    return hit;
  }

  auto hit = Lookup(*durable_, durable_counters_, key, durable_failed);
  if (hit) {
    if (!fast_failed) Backfill(*hit);
    return hit;
  }

  if (fast_failed && durable_failed) {
    degraded_reads_++;
  }
  return std::nullopt;
}

std::optional<CacheEntry> TieredCache::GetStale(const std::string& key, std::chrono::milliseconds grace) {
  try {
    auto entry = durable_->Get(key);
    if (!entry) return std::nullopt;

    const auto now = util::Now();
    if (entry->IsExpired(now) && entry->expires_at + grace > now) {
      return entry;
    }
  } catch (const util::CacheLayerDown& e) {
    durable_counters_.errors++;
    ROADCAST_LOG_WARN("cache layer unavailable on stale read", {StringField("key", key), StringField("error", e.what())});
  }
  return std::nullopt;
}

void TieredCache::Backfill(const CacheEntry& entry) {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(entry.expires_at - util::Now());
  const auto ttl       = std::min(remaining, max_backfill_ttl_);
  if (ttl.count() <= 0) return;

  try {
    fast_->Put(entry, ttl);
    fast_counters_.writes++;
    backfills_++;
  } catch (const util::CacheLayerDown& e) {
    fast_counters_.errors++;
    ROADCAST_LOG_WARN("cache backfill failed", {StringField("key", entry.key), StringField("error", e.what())});
  }
}

void TieredCache::Put(const CacheEntry& entry, std::chrono::milliseconds fast_ttl, bool persist_durable) {
  if (entry.expires_at <= entry.created_at) {
    throw util::Invalid("cache entry " + entry.key + " expires before it was created");
  }

  if (fast_ttl.count() > 0) {
    try {
      fast_->Put(entry, fast_ttl);
      fast_counters_.writes++;
    } catch (const util::CacheLayerDown& e) {
      fast_counters_.errors++;
      ROADCAST_LOG_WARN("cache layer unavailable on write",
                        {StringField("tier", "fast"), StringField("key", entry.key), StringField("error", e.what())});
    }
  }

  if (!persist_durable) return;

  try {
    durable_->Put(entry, std::nullopt);
    durable_counters_.writes++;
  } catch (const util::CacheLayerDown& e) {
    durable_counters_.errors++;
    ROADCAST_LOG_WARN("cache layer unavailable on write",
                      {StringField("tier", "durable"), StringField("key", entry.key), StringField("error", e.what())});
  }
}

bool TieredCache::Invalidate(const std::string& key) {
  bool removed = false;
  for (auto* layer : {fast_.get(), durable_.get()}) {
    try {
      removed = layer->Remove(key) || removed;
    } catch (const util::CacheLayerDown& e) {
      (layer == fast_.get() ? fast_counters_ : durable_counters_).errors++;
      ROADCAST_LOG_WARN("cache invalidate failed",
                        {StringField("tier", TierName(layer->tier())), StringField("key", key), StringField("error", e.what())});
    }
  }
  return removed;
}

std::uint64_t TieredCache::PurgeExpired(util::TimePoint cutoff) {
  std::uint64_t removed = 0;
  for (auto* layer : {fast_.get(), durable_.get()}) {
    try {
      removed += layer->RemoveExpired(cutoff);
    } catch (const util::CacheLayerDown& e) {
      (layer == fast_.get() ? fast_counters_ : durable_counters_).errors++;
      ROADCAST_LOG_WARN("cache purge failed", {StringField("tier", TierName(layer->tier())), StringField("error", e.what())});
    }
  }
  return removed;
}

TieredCacheStats TieredCache::Stats() const {
  TieredCacheStats out;
  out.fast           = fast_counters_.Snapshot();
  out.durable        = durable_counters_.Snapshot();
  out.backfills      = backfills_.load();
  out.degraded_reads = degraded_reads_.load();
  return out;
}

} // namespace roadcast::cache
