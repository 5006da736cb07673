#include "engine_options.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace roadcast::config {

namespace {

std::chrono::milliseconds DurationOr(bool has, const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  return has ? roadcast::util::FromProto(d) : fallback;
}

} // namespace

EngineOptions FromConfig(const roadcast::runtime::config::RuntimeConfig& config) {
  EngineOptions opts;

  const auto& spatial = config.spatial();
  if (spatial.cell_resolution() != 0) {
    opts.spatial.cell_resolution = static_cast<int>(spatial.cell_resolution());
  }
  if (opts.spatial.cell_resolution > 15) {
    throw std::invalid_argument("spatial.cell_resolution must be within 0..15");
  }
  if (spatial.neighbor_ring() != 0) {
    opts.spatial.neighbor_ring = static_cast<int>(spatial.neighbor_ring());
  }

  const auto& cache = config.cache();
  if (cache.fast_max_entries() != 0) {
    opts.cache.fast_max_entries = cache.fast_max_entries();
  }
  opts.cache.route_fast_ttl = DurationOr(cache.has_route_fast_ttl(), cache.route_fast_ttl(), opts.cache.route_fast_ttl);
  opts.cache.stale_grace    = DurationOr(cache.has_stale_grace(), cache.stale_grace(), opts.cache.stale_grace);
  opts.cache.purge_interval = DurationOr(cache.has_purge_interval(), cache.purge_interval(), opts.cache.purge_interval);

  const auto& gate           = config.gate();
  opts.gate.leader_lock_ttl  = DurationOr(gate.has_leader_lock_ttl(), gate.leader_lock_ttl(), opts.gate.leader_lock_ttl);
  opts.gate.follower_wait_timeout =
      DurationOr(gate.has_follower_wait_timeout(), gate.follower_wait_timeout(), opts.gate.follower_wait_timeout);
  if (opts.gate.leader_lock_ttl.count() <= 0 || opts.gate.follower_wait_timeout.count() <= 0) {
    throw std::invalid_argument("gate timeouts must be positive");
  }

  const auto& graph = config.graph();
  if (graph.snap_tolerance_m() > 0) opts.graph.snap_tolerance_m = graph.snap_tolerance_m();
  if (graph.access_radius_m() > 0) opts.graph.access_radius_m = graph.access_radius_m();
  if (graph.sample_interval_m() > 0) opts.graph.sample_interval_m = graph.sample_interval_m();
  if (graph.default_speed_kmh() > 0) opts.graph.default_speed_kmh = graph.default_speed_kmh();

  const auto& weather           = config.weather();
  opts.weather.provider_timeout = DurationOr(weather.has_provider_timeout(), weather.provider_timeout(), opts.weather.provider_timeout);
  if (weather.max_parallel_fetches() != 0) {
    opts.weather.max_parallel_fetches = weather.max_parallel_fetches();
  }
  if (!weather.default_time_zone().empty()) {
    opts.weather.default_time_zone = weather.default_time_zone();
  }
  if (!weather.initial_generation().empty()) {
    opts.weather.initial_generation = weather.initial_generation();
  }
  if (weather.segment_interval_m() > 0.0) {
    opts.weather.segment_interval_m = weather.segment_interval_m();
  }

  const auto& routing          = config.routing();
  opts.routing.routing_timeout = DurationOr(routing.has_provider_timeout(), routing.provider_timeout(), opts.routing.routing_timeout);

  const auto& discovery          = config.discovery();
  opts.routing.discovery_enabled = discovery.enabled();
  opts.routing.discovery_timeout =
      DurationOr(discovery.has_provider_timeout(), discovery.provider_timeout(), opts.routing.discovery_timeout);

  return opts;
}

} // namespace roadcast::config
