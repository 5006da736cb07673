#include "trip_planner.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/spatial/geo.hpp"

namespace roadcast::core {

TripPlanner::TripPlanner(std::shared_ptr<RouteCacheCoordinator> routes, std::shared_ptr<WeatherSegmentCache> weather, config::WeatherOptions options)
    : routes_(std::move(routes)), weather_(std::move(weather)), options_(std::move(options)) {
}

TripPlan TripPlanner::PlanTrip(const graph::PlaceInput& source, const graph::PlaceInput& target, util::TimePoint departure) {
  TripPlan plan;
  plan.route = routes_->GetRoute(source, target);

  std::vector<spatial::Coordinate> geometry;
  geometry.reserve(plan.route.geometry_size());
  for (const auto& p : plan.route.geometry()) {
    geometry.push_back({p.lat(), p.lon()});
  }
  if (geometry.empty()) {
    return plan;
  }

  const auto   samples  = spatial::SampleEvery(geometry, options_.segment_interval_m);
  const double total_m  = spatial::PathLengthMeters(geometry);
  const double travel_s = plan.route.duration_hours() * 3600.0;

  std::vector<WeatherQuery> queries;
  queries.reserve(samples.size());

  double walked_m = 0.0;
  for (std::size_t i = 0; i < samples.size(); ++i) {
    if (i > 0) walked_m += spatial::HaversineMeters(samples[i - 1], samples[i]);
    const double fraction = total_m > 0 ? std::min(1.0, walked_m / total_m) : 0.0;
    const auto   offset   = std::chrono::duration_cast<util::Clock::duration>(std::chrono::duration<double>(travel_s * fraction));
    queries.push_back({samples[i], departure + offset, source.time_zone});
  }

  plan.segments = weather_->GetMany(queries);
  ROADCAST_LOG_INFO("trip planned", {observability::IntField("segments", static_cast<std::int64_t>(plan.segments.size())),
                                     observability::DoubleField("distance_km", plan.route.distance_km())});
  return plan;
}

} // namespace roadcast::core
