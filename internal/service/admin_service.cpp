#include "admin_service.hpp"

#include "convert.hpp"
#include "internal/cache/cache_janitor.hpp"
#include "internal/cache/dedup_gate.hpp"
#include "internal/cache/tiered_cache.hpp"
#include "internal/core/route_cache_coordinator.hpp"
#include "internal/core/weather_segment_cache.hpp"
#include "internal/graph/road_graph_store.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace roadcast::service {

using namespace roadcast::services::v1;
using roadcast::admin::v1::StatsRequest;
using roadcast::admin::v1::StatsResponse;
using roadcast::observability::StringField;

namespace {

void FillLayer(roadcast::admin::v1::LayerStats* out, const cache::LayerCounters& in) {
  out->set_hits(in.hits);
  out->set_misses(in.misses);
  out->set_errors(in.errors);
  out->set_writes(in.writes);
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    StatsResponse resp;

    const auto cache = ctx_.cache->Stats();
    FillLayer(resp.mutable_fast(), cache.fast);
    FillLayer(resp.mutable_durable(), cache.durable);
    resp.set_backfills(cache.backfills);
    resp.set_degraded_reads(cache.degraded_reads);

    const auto gate = ctx_.gate->Stats();
    resp.mutable_gate()->set_leaders(gate.leaders);
    resp.mutable_gate()->set_followers(gate.followers);
    resp.mutable_gate()->set_follower_timeouts(gate.follower_timeouts);
    resp.mutable_gate()->set_expired_locks(gate.expired_locks);

    const auto weather = ctx_.weather->Stats();
    resp.mutable_weather()->set_provider_calls(weather.provider_calls);
    resp.mutable_weather()->set_provider_failures(weather.provider_failures);
    resp.mutable_weather()->set_stale_serves(weather.stale_serves);
    resp.mutable_weather()->set_model_refreshes(weather.model_refreshes);
    resp.mutable_weather()->set_generation(weather.generation);

    const auto routes = ctx_.routes->Stats();
    resp.mutable_routes()->set_requests(routes.requests);
    resp.mutable_routes()->set_graph_hits(routes.graph_hits);
    resp.mutable_routes()->set_injections(routes.injections);
    resp.mutable_routes()->set_provider_failures(routes.provider_failures);

    const auto graph = ctx_.graph->Counts();
    resp.mutable_graph()->set_places(graph.places);
    resp.mutable_graph()->set_nodes(graph.nodes);
    resp.mutable_graph()->set_access_points(graph.access_points);
    resp.mutable_graph()->set_edges(graph.edges);
    return resp;
  });
}

InvalidateResponse AdminService::Invalidate(const InvalidateRequest& req) {
  return ObserveRpc("AdminService.Invalidate", [&] {
    if (req.key().empty()) {
      throw util::Invalid("invalidate: key is required");
    }
    if (!ctx_.cache->Invalidate(req.key())) {
      throw util::NotFound("no cache entry for key " + req.key());
    }
    ROADCAST_LOG_INFO("cache key invalidated", {StringField("key", req.key())});
    return InvalidateResponse{};
  });
}

InvalidateRouteResponse AdminService::InvalidateRoute(const InvalidateRouteRequest& req) {
  return ObserveRpc("AdminService.InvalidateRoute", [&] {
    InvalidateRouteResponse resp;
    resp.set_found(ctx_.routes->InvalidateRoute(ToPlaceInput(req.source()), ToPlaceInput(req.target())));
    return resp;
  });
}

ReloadSpatialIndexResponse AdminService::ReloadSpatialIndex(const ReloadSpatialIndexRequest&) {
  return ObserveRpc("AdminService.ReloadSpatialIndex", [&] {
    ctx_.graph->Reload();
    const auto counts = ctx_.graph->Counts();

    ReloadSpatialIndexResponse resp;
    resp.set_nodes(counts.nodes);
    resp.set_edges(counts.edges);
    return resp;
  });
}

PurgeExpiredResponse AdminService::PurgeExpired(const PurgeExpiredRequest&) {
  return ObserveRpc("AdminService.PurgeExpired", [&] {
    PurgeExpiredResponse resp;
    resp.set_removed(ctx_.janitor->RunOnce());
    return resp;
  });
}

} // namespace roadcast::service
