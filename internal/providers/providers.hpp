#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/spatial/geo.hpp"
#include "internal/util/time.hpp"
#include "roadcast/core/v1/types.pb.h"

namespace roadcast::providers {

/*
  Upstream collaborators.

  Every call carries the caller's timeout. Implementations throw
  util::ProviderUnavailable on timeout, transport failure or an unusable
  answer; they do not retry.
*/

class WeatherProvider {
 public:
  virtual ~WeatherProvider() = default;

  // Forecast for the hour containing `at`. model_run identifies the upstream
  // model generation the answer came from.
  virtual roadcast::core::v1::WeatherPayload Fetch(const spatial::Coordinate& location, util::TimePoint at,
                                                   std::chrono::milliseconds timeout) = 0;
};

// A stretch of the route on one road; distances are along the path.
struct RouteStep {
  std::string road_type;
  std::string road_name;
  double      distance_m = 0.0;
};

struct RouteGeometry {
  std::vector<spatial::Coordinate> points;
  double                           distance_km    = 0.0;
  double                           duration_hours = 0.0;
  std::vector<RouteStep>           steps;
};

class RoutingProvider {
 public:
  virtual ~RoutingProvider() = default;

  virtual RouteGeometry Route(const spatial::Coordinate& origin, const spatial::Coordinate& destination,
                              std::chrono::milliseconds timeout) = 0;
};

struct DiscoveredPlace {
  std::string         name;
  std::string         place_type;
  std::string         region;
  spatial::Coordinate coord;
};

class PlaceDiscoveryProvider {
 public:
  virtual ~PlaceDiscoveryProvider() = default;

  virtual std::vector<DiscoveredPlace> PlacesAlong(const std::vector<spatial::Coordinate>& geometry, std::chrono::milliseconds timeout) = 0;
};

// Stand-in used until a real client is configured; every call fails as
// ProviderUnavailable so only cached and graph-resident data is served.
class UnconfiguredWeatherProvider final : public WeatherProvider {
 public:
  roadcast::core::v1::WeatherPayload Fetch(const spatial::Coordinate&, util::TimePoint, std::chrono::milliseconds) override;
};

class UnconfiguredRoutingProvider final : public RoutingProvider {
 public:
  RouteGeometry Route(const spatial::Coordinate&, const spatial::Coordinate&, std::chrono::milliseconds) override;
};

class UnconfiguredDiscoveryProvider final : public PlaceDiscoveryProvider {
 public:
  std::vector<DiscoveredPlace> PlacesAlong(const std::vector<spatial::Coordinate>&, std::chrono::milliseconds) override;
};

} // namespace roadcast::providers
