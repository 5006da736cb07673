#pragma once

#include <memory>

namespace roadcast::core {
class RouteCacheCoordinator;
class WeatherSegmentCache;
class TripPlanner;
}
namespace roadcast::cache {
class TieredCache;
class DedupGate;
class CacheJanitor;
}
namespace roadcast::graph { class RoadGraphStore; }

namespace roadcast::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<roadcast::core::RouteCacheCoordinator> routes;
  std::shared_ptr<roadcast::core::WeatherSegmentCache>   weather;
  std::shared_ptr<roadcast::core::TripPlanner>           trips;
  std::shared_ptr<roadcast::cache::TieredCache>          cache;
  std::shared_ptr<roadcast::cache::DedupGate>            gate;
  std::shared_ptr<roadcast::cache::CacheJanitor>         janitor;
  std::shared_ptr<roadcast::graph::RoadGraphStore>       graph;
};

}
