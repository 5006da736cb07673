#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/cache/dedup_gate.hpp"
#include "internal/cache/temporal_key.hpp"
#include "internal/cache/tiered_cache.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/providers/providers.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/spatial/cell_index.hpp"
#include "roadcast/core/v1/types.pb.h"

namespace roadcast::core {

struct WeatherQuery {
  spatial::Coordinate coord;
  util::TimePoint     forecast_time;
  // IANA zone of the location; empty uses the configured default.
  std::string time_zone;
};

struct WeatherResult {
  spatial::CellId                    cell = 0;
  roadcast::core::v1::WeatherPayload payload;
  bool                               stale = false;
};

struct WeatherCounters {
  std::uint64_t provider_calls    = 0;
  std::uint64_t provider_failures = 0;
  std::uint64_t stale_serves      = 0;
  std::uint64_t model_refreshes   = 0;
  std::string   generation;
};

/*
  WeatherSegmentCache

  Per-cell, per-local-hour weather behind the singleflight gate. Keys carry
  the upstream model generation; a fetch reporting a newer model_run
  advances it, so entries of the old generation stop being reachable.

  A forecast hour that has already ended is never served from cache: it is
  fetched from origin and not stored. The stale-grace entry is only used
  when that origin call fails.
*/
class WeatherSegmentCache {
 public:
  WeatherSegmentCache(std::shared_ptr<spatial::SpatialCellIndex> index, std::shared_ptr<cache::TieredCache> cache,
                      std::shared_ptr<cache::DedupGate> gate, std::shared_ptr<providers::WeatherProvider> provider,
                      config::WeatherOptions options, config::GateOptions gate_options, std::chrono::milliseconds stale_grace);

  // Throws util::Invalid for a bad coordinate or zone and
  // util::ProviderUnavailable when origin fails with nothing to fall back on.
  WeatherResult Get(const spatial::Coordinate& coord, util::TimePoint forecast_time, const std::string& time_zone = {});

  // One segment per query, in order. Queries sharing a cell and hour are
  // fetched once; failures are reported per segment.
  std::vector<roadcast::core::v1::WeatherSegment> GetMany(const std::vector<WeatherQuery>& queries);

  roadcast::core::v1::WeatherSegment ToSegment(const WeatherResult& result, util::TimePoint forecast_time) const;

  std::string     Generation() const;
  WeatherCounters Stats() const;

 private:
  WeatherResult FetchAndStore(spatial::CellId cell, util::TimePoint forecast, const absl::TimeZone& zone, const std::string& gate_key,
                              bool store);
  std::optional<WeatherResult> Decode(spatial::CellId cell, const cache::CacheEntry& entry, bool stale) const;
  void                         ObserveModelRun(const std::string& model_run);

  std::shared_ptr<spatial::SpatialCellIndex>   index_;
  std::shared_ptr<cache::TieredCache>          cache_;
  std::shared_ptr<cache::DedupGate>            gate_;
  std::shared_ptr<providers::WeatherProvider>  provider_;
  config::WeatherOptions                       options_;
  config::GateOptions                          gate_options_;
  std::chrono::milliseconds                    stale_grace_;
  absl::TimeZone                               default_zone_;

  mutable std::mutex generation_mutex_;
  std::string        generation_;

  std::atomic<std::uint64_t> provider_calls_{0};
  std::atomic<std::uint64_t> provider_failures_{0};
  std::atomic<std::uint64_t> stale_serves_{0};
  std::atomic<std::uint64_t> model_refreshes_{0};

  runtime::WorkerPool pool_;
};

} // namespace roadcast::core
