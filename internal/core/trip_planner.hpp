#pragma once

#include <memory>

#include "internal/util/time.hpp"
#include "route_cache_coordinator.hpp"
#include "weather_segment_cache.hpp"

namespace roadcast::core {

struct TripPlan {
  roadcast::core::v1::RouteRecord                 route;
  std::vector<roadcast::core::v1::WeatherSegment> segments;
};

/*
  Route plus the weather met along it. The route geometry is sampled every
  segment_interval_m; each sample is forecast for the moment the trip is
  expected to reach it, assuming constant speed over the route.
*/
class TripPlanner {
 public:
  TripPlanner(std::shared_ptr<RouteCacheCoordinator> routes, std::shared_ptr<WeatherSegmentCache> weather, config::WeatherOptions options);

  // Route errors propagate; weather errors are reported per segment.
  TripPlan PlanTrip(const graph::PlaceInput& source, const graph::PlaceInput& target, util::TimePoint departure);

 private:
  std::shared_ptr<RouteCacheCoordinator> routes_;
  std::shared_ptr<WeatherSegmentCache>   weather_;
  config::WeatherOptions                 options_;
};

} // namespace roadcast::core
