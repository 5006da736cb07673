#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace roadcast::config {

/*
  Typed view of RuntimeConfig with defaults applied.

  Built once at start-up; components copy the sub-struct they need.
*/

struct SpatialOptions {
  // H3 resolution; 7 gives cells of roughly 5 km^2.
  int cell_resolution = 7;
  int neighbor_ring   = 1;
};

struct CacheOptions {
  std::size_t               fast_max_entries = 100000;
  std::chrono::milliseconds route_fast_ttl   = std::chrono::hours(24);
  std::chrono::milliseconds stale_grace      = std::chrono::hours(1);
  std::chrono::milliseconds purge_interval   = std::chrono::minutes(10);
};

struct GateOptions {
  std::chrono::milliseconds leader_lock_ttl       = std::chrono::seconds(30);
  std::chrono::milliseconds follower_wait_timeout = std::chrono::seconds(10);
};

struct GraphOptions {
  double snap_tolerance_m  = 50.0;
  double access_radius_m   = 5000.0;
  double sample_interval_m = 1000.0;
  double default_speed_kmh = 50.0;
};

struct WeatherOptions {
  std::chrono::milliseconds provider_timeout     = std::chrono::seconds(10);
  std::size_t               max_parallel_fetches = 8;
  std::string               default_time_zone    = "UTC";
  std::string               initial_generation   = "0";
  double                    segment_interval_m   = 10000.0;
};

struct RoutingOptions {
  std::chrono::milliseconds routing_timeout   = std::chrono::seconds(30);
  bool                      discovery_enabled = false;
  std::chrono::milliseconds discovery_timeout = std::chrono::seconds(30);
};

struct EngineOptions {
  SpatialOptions spatial;
  CacheOptions   cache;
  GateOptions    gate;
  GraphOptions   graph;
  WeatherOptions weather;
  RoutingOptions routing;
};

// Throws std::invalid_argument for values outside their valid range.
EngineOptions FromConfig(const roadcast::runtime::config::RuntimeConfig& config);

} // namespace roadcast::config
