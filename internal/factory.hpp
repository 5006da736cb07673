#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/cache_janitor.hpp"
#include "internal/cache/dedup_gate.hpp"
#include "internal/cache/tiered_cache.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/core/route_cache_coordinator.hpp"
#include "internal/core/trip_planner.hpp"
#include "internal/core/weather_segment_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/road_graph_store.hpp"
#include "internal/providers/providers.hpp"
#include "internal/service/service_context.hpp"
#include "internal/spatial/cell_index.hpp"

namespace roadcast::factory {

struct Providers {
  std::shared_ptr<providers::WeatherProvider>        weather;
  std::shared_ptr<providers::RoutingProvider>        routing;
  std::shared_ptr<providers::PlaceDiscoveryProvider> discovery;
};

/*
  Engine

  Every long-lived component of one roadcast instance. The graph is loaded
  from the repository and the janitor is running once BuildEngine returns.
*/
struct Engine {
  config::EngineOptions options;

  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<spatial::SpatialCellIndex> cells;
  std::shared_ptr<graph::RoadGraphStore>     graph;
  std::shared_ptr<cache::TieredCache>        cache;
  std::shared_ptr<cache::DedupGate>          gate;
  std::shared_ptr<cache::CacheJanitor>       janitor;

  std::shared_ptr<core::WeatherSegmentCache>   weather;
  std::shared_ptr<core::RouteCacheCoordinator> routes;
  std::shared_ptr<core::TripPlanner>           trips;

  service::ServiceContext Context() const;
};

/*
  BuildRepository

  The only place that knows concrete storage backends. A backend compiled
  out of this build is rejected with std::runtime_error.
*/
std::shared_ptr<db::Repository> BuildRepository(const roadcast::runtime::config::RuntimeConfig& config);

Engine BuildEngine(std::shared_ptr<db::Repository> repository, config::EngineOptions options, Providers providers);

// Providers that report ProviderUnavailable on every call.
Providers UnconfiguredProviders();

} // namespace roadcast::factory
