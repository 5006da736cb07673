#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/dedup_gate.hpp"
#include "internal/cache/tiered_cache.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/path_finder.hpp"
#include "internal/graph/road_graph_store.hpp"
#include "internal/graph/route_injector.hpp"
#include "internal/providers/providers.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "roadcast/core/v1/types.pb.h"

namespace roadcast::core {

struct RouteCounters {
  std::uint64_t requests          = 0;
  std::uint64_t graph_hits        = 0;
  std::uint64_t injections        = 0;
  std::uint64_t provider_failures = 0;
};

/*
  RouteCacheCoordinator

  getRoute for an ordered place pair:

    cache (fast, durable) -> routes table -> graph search
      -> on no path: routing provider, inject geometry, search once more

  Route entries never expire on their own; only InvalidateRoute removes
  them. Nothing is cached unless a full path was found.
*/
class RouteCacheCoordinator {
 public:
  RouteCacheCoordinator(std::shared_ptr<db::Repository> repo, std::shared_ptr<graph::RoadGraphStore> graph,
                        std::shared_ptr<cache::TieredCache> cache, std::shared_ptr<cache::DedupGate> gate,
                        std::shared_ptr<providers::RoutingProvider> routing, std::shared_ptr<providers::PlaceDiscoveryProvider> discovery,
                        config::EngineOptions options);
  ~RouteCacheCoordinator();

  // Throws util::Invalid for bad places, util::NotFound when no path exists
  // even after injection, util::ProviderUnavailable when routing fails.
  roadcast::core::v1::RouteRecord GetRoute(const graph::PlaceInput& source, const graph::PlaceInput& target);

  // Drops the cached entry and the stored route row; true if either existed.
  bool InvalidateRoute(const graph::PlaceInput& source, const graph::PlaceInput& target);

  static std::string RouteKey(graph::PlaceId source, graph::PlaceId target);

  RouteCounters Stats() const;

 private:
  std::optional<roadcast::core::v1::RouteRecord> Lookup(const std::string& key, graph::PlaceId source, graph::PlaceId target);
  roadcast::core::v1::RouteRecord Compute(const db::model::PlaceRecord& source, const db::model::PlaceRecord& target, const std::string& key);

  std::vector<graph::NodeId> Candidates(const db::model::PlaceRecord& place) const;
  std::optional<graph::Path> BestPath(const db::model::PlaceRecord& source, const db::model::PlaceRecord& target) const;

  void Persist(const roadcast::core::v1::RouteRecord& record, const std::string& key);
  void SeedPlacesAsync(std::vector<spatial::Coordinate> geometry);

  std::shared_ptr<db::Repository>                     repo_;
  std::shared_ptr<graph::RoadGraphStore>              graph_;
  std::shared_ptr<cache::TieredCache>                 cache_;
  std::shared_ptr<cache::DedupGate>                   gate_;
  std::shared_ptr<providers::RoutingProvider>         routing_;
  std::shared_ptr<providers::PlaceDiscoveryProvider>  discovery_;
  config::EngineOptions                               options_;

  graph::PathFinder    finder_;
  graph::RouteInjector injector_;

  std::atomic<std::uint64_t> requests_{0};
  std::atomic<std::uint64_t> graph_hits_{0};
  std::atomic<std::uint64_t> injections_{0};
  std::atomic<std::uint64_t> provider_failures_{0};

  // Place seeding runs here, off the request path.
  runtime::WorkerPool background_;
};

} // namespace roadcast::core
