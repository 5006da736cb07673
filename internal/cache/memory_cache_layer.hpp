#pragma once

#include <cstddef>
#include <set>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "cache_layer.hpp"

namespace roadcast::cache {

/*
  Fast, volatile tier.

  Each entry is evicted at min(expires_at, now + ttl). When full, the entry
  with the nearest eviction deadline is dropped first.

  Thread safety:
    - shared reads
    - exclusive writes
*/
class MemoryCacheLayer final : public CacheLayer {
 public:
  explicit MemoryCacheLayer(std::size_t max_entries);

  Tier tier() const override {
    return Tier::kFast;
  }

  std::optional<CacheEntry> Get(const std::string& key) override;
  void                      Put(const CacheEntry& entry, std::optional<std::chrono::milliseconds> ttl) override;
  bool                      Remove(const std::string& key) override;
  std::uint64_t             RemoveExpired(util::TimePoint cutoff) override;

  std::size_t Size() const;

 private:
  struct Slot {
    CacheEntry      entry;
    util::TimePoint evict_at;
  };

  void EraseLocked(std::unordered_map<std::string, Slot>::iterator it);

  std::size_t max_entries_;

  mutable std::shared_mutex                             mutex_;
  std::unordered_map<std::string, Slot>                 entries_;
  std::set<std::pair<util::TimePoint, std::string>>     by_deadline_;
};

} // namespace roadcast::cache
