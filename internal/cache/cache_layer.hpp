#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "cache_entry.hpp"

namespace roadcast::cache {

enum class Tier { kFast, kDurable };

inline const char* TierName(Tier tier) {
  return tier == Tier::kFast ? "fast" : "durable";
}

/*
  One cache tier.

  Get() may return an entry whose expires_at has passed (the durable tier
  keeps them until purged); the caller decides between fresh, stale-grace
  and absent. A layer that cannot be reached throws util::CacheLayerDown
  from any method.
*/
class CacheLayer {
 public:
  virtual ~CacheLayer() = default;

  virtual Tier tier() const = 0;

  virtual std::optional<CacheEntry> Get(const std::string& key) = 0;

  // ttl bounds how long this layer keeps the entry; nullopt keeps it until
  // entry.expires_at (or forever for durable layers).
  virtual void Put(const CacheEntry& entry, std::optional<std::chrono::milliseconds> ttl) = 0;

  // Returns false when the key was not present.
  virtual bool Remove(const std::string& key) = 0;

  // Drops entries whose expiry is at or before cutoff.
  virtual std::uint64_t RemoveExpired(util::TimePoint cutoff) = 0;
};

} // namespace roadcast::cache
