#pragma once

#include <memory>

#include "cache_layer.hpp"
#include "internal/db/api/repository.hpp"

namespace roadcast::cache {

/*
  Durable tier backed by the cache_entries table.

  Every repository failure, thrown or returned, is reported as
  util::CacheLayerDown so TieredCache can fall back.
*/
class DurableCacheLayer final : public CacheLayer {
 public:
  explicit DurableCacheLayer(std::shared_ptr<db::Repository> repo);

  Tier tier() const override {
    return Tier::kDurable;
  }

  std::optional<CacheEntry> Get(const std::string& key) override;
  void                      Put(const CacheEntry& entry, std::optional<std::chrono::milliseconds> ttl) override;
  bool                      Remove(const std::string& key) override;
  std::uint64_t             RemoveExpired(util::TimePoint cutoff) override;

 private:
  std::shared_ptr<db::Repository> repo_;
};

} // namespace roadcast::cache
