#include "route_cache_coordinator.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/cache/cache_entry.hpp"
#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace roadcast::core {

using roadcast::core::v1::RouteRecord;
using roadcast::observability::IntField;
using roadcast::observability::StringField;

namespace {

std::optional<RouteRecord> ParseRecord(const std::string& key, const std::string& json) {
  RouteRecord record;
  auto        status = google::protobuf::util::JsonStringToMessage(json, &record);
  if (!status.ok()) {
    ROADCAST_LOG_WARN("discarding undecodable route", {StringField("key", key), StringField("error", std::string(status.message()))});
    return std::nullopt;
  }
  return record;
}

spatial::Coordinate CoordOf(const db::model::PlaceRecord& place) {
  return {place.lat, place.lon};
}

} // namespace

RouteCacheCoordinator::RouteCacheCoordinator(std::shared_ptr<db::Repository> repo, std::shared_ptr<graph::RoadGraphStore> graph,
                                             std::shared_ptr<cache::TieredCache> cache, std::shared_ptr<cache::DedupGate> gate,
                                             std::shared_ptr<providers::RoutingProvider>        routing,
                                             std::shared_ptr<providers::PlaceDiscoveryProvider> discovery, config::EngineOptions options)
    : repo_(std::move(repo)),
      graph_(std::move(graph)),
      cache_(std::move(cache)),
      gate_(std::move(gate)),
      routing_(std::move(routing)),
      discovery_(std::move(discovery)),
      options_(std::move(options)),
      finder_(*graph_),
      injector_(*graph_),
      background_(1) {
}

RouteCacheCoordinator::~RouteCacheCoordinator() {
  background_.Stop();
}

std::string RouteCacheCoordinator::RouteKey(graph::PlaceId source, graph::PlaceId target) {
  return "route:" + std::to_string(source) + ":" + std::to_string(target);
}

RouteRecord RouteCacheCoordinator::GetRoute(const graph::PlaceInput& source, const graph::PlaceInput& target) {
  requests_++;

  const auto src = graph_->UpsertPlace(source);
  const auto tgt = graph_->UpsertPlace(target);
  if (src.id == tgt.id) {
    throw util::Invalid("source and target are the same place: " + source.name);
  }

  const auto key = RouteKey(src.id, tgt.id);
  return cache::ReadThrough(
      *gate_, key, options_.gate, [&] { return Lookup(key, src.id, tgt.id); }, [&] { return Compute(src, tgt, key); });
}

std::optional<RouteRecord> RouteCacheCoordinator::Lookup(const std::string& key, graph::PlaceId source, graph::PlaceId target) {
  if (auto entry = cache_->Get(key)) {
    return ParseRecord(key, entry->payload);
  }

  std::optional<db::model::RouteRow> row;
  try {
    auto tx = repo_->Begin();
    row     = repo_->GetRoute(*tx, source, target);
    tx->Commit();
  } catch (const std::exception& e) {
    ROADCAST_LOG_WARN("route table unavailable", {StringField("key", key), StringField("error", e.what())});
    return std::nullopt;
  }
  if (!row) return std::nullopt;

  auto record = ParseRecord(key, row->payload_json);
  if (record) {
    // Re-warm both tiers from the stored row.
    cache::CacheEntry entry{key, row->payload_json, util::Now(), cache::NoExpiry(), {}};
    cache_->Put(entry, options_.cache.route_fast_ttl, true);
  }
  return record;
}

std::vector<graph::NodeId> RouteCacheCoordinator::Candidates(const db::model::PlaceRecord& place) const {
  auto nodes = graph_->AccessNodes(place.id);
  if (nodes.empty()) {
    if (auto nearest = graph_->Locator().Nearest(CoordOf(place), options_.graph.access_radius_m)) {
      nodes.push_back(*nearest);
    }
  }
  return nodes;
}

std::optional<graph::Path> RouteCacheCoordinator::BestPath(const db::model::PlaceRecord& source, const db::model::PlaceRecord& target) const {
  const auto sources = Candidates(source);
  const auto targets = Candidates(target);
  if (sources.empty() || targets.empty()) return std::nullopt;
  return finder_.ShortestPath(sources, targets);
}

RouteRecord RouteCacheCoordinator::Compute(const db::model::PlaceRecord& source, const db::model::PlaceRecord& target, const std::string& key) {
  observability::SpanScope span("roadcast.route.compute");
  span.SetAttribute("route.key", key);

  auto path = BestPath(source, target);
  if (path) {
    graph_hits_++;
  } else {
    providers::RouteGeometry geometry;
    try {
      geometry = routing_->Route(CoordOf(source), CoordOf(target), options_.routing.routing_timeout);
      observability::Metrics::Instance().RecordProviderCall("routing", true);
    } catch (const util::ProviderUnavailable& e) {
      provider_failures_++;
      observability::Metrics::Instance().RecordProviderCall("routing", false);
      ROADCAST_LOG_WARN("routing provider failed", {StringField("key", key), StringField("error", e.what())});
      throw;
    }

    if (geometry.points.size() < 2) {
      provider_failures_++;
      throw util::ProviderUnavailable("routing provider returned no usable geometry for " + key);
    }

    const auto injected = injector_.Inject(geometry, source.id, target.id);
    injections_++;
    observability::Metrics::Instance().RecordGraphInjection(injected.edges);
    span.AddEvent("graph.injected");

    if (options_.routing.discovery_enabled) {
      SeedPlacesAsync(geometry.points);
    }

    path = BestPath(source, target);
    if (!path) {
      throw util::NotFound("no path between " + source.name + " and " + target.name);
    }
  }

  RouteRecord record;
  record.set_source_place_id(source.id);
  record.set_target_place_id(target.id);
  for (auto id : path->nodes) {
    record.add_nodes(id);
    if (auto node = graph_->Node(id)) {
      auto* point = record.add_geometry();
      point->set_lat(node->coord.lat);
      point->set_lon(node->coord.lon);
    }
  }
  record.set_distance_km(path->distance_m / 1000.0);
  record.set_duration_hours(path->duration_s / 3600.0);
  *record.mutable_created_at() = util::ToProto(util::Now());

  Persist(record, key);
  return record;
}

void RouteCacheCoordinator::Persist(const RouteRecord& record, const std::string& key) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(record, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode route: " + std::string(status.message()));
  }

  db::model::RouteRow row;
  row.source_place_id = record.source_place_id();
  row.target_place_id = record.target_place_id();
  row.payload_json    = json;
  row.distance_km     = record.distance_km();
  row.duration_hours  = record.duration_hours();
  row.created_at_ms   = util::ToUnixMillis(util::FromProto(record.created_at()));

  try {
    auto tx = repo_->Begin();
    db::ThrowIfDbError(repo_->UpsertRoute(*tx, row), "store route " + key);
    tx->Commit();
  } catch (const std::exception& e) {
    // The cache tiers below still carry the route.
    ROADCAST_LOG_WARN("route row not stored", {StringField("key", key), StringField("error", e.what())});
  }

  cache::CacheEntry entry{key, std::move(json), util::FromProto(record.created_at()), cache::NoExpiry(), {}};
  cache_->Put(entry, options_.cache.route_fast_ttl, true);
}

void RouteCacheCoordinator::SeedPlacesAsync(std::vector<spatial::Coordinate> geometry) {
  auto discovery = discovery_;
  auto graph     = graph_;
  auto timeout   = options_.routing.discovery_timeout;

  // Fire and forget; the returned future is not awaited.
  background_.Submit([discovery, graph, timeout, geometry = std::move(geometry)] {
    try {
      std::int64_t seeded = 0;
      for (const auto& place : discovery->PlacesAlong(geometry, timeout)) {
        graph->UpsertPlace(graph::PlaceInput{place.name, place.place_type, place.region, place.coord, {}});
        ++seeded;
      }
      ROADCAST_LOG_INFO("seeded places along route", {IntField("places", seeded)});
    } catch (const std::exception& e) {
      ROADCAST_LOG_WARN("place seeding skipped", {StringField("error", e.what())});
    }
  });
}

bool RouteCacheCoordinator::InvalidateRoute(const graph::PlaceInput& source, const graph::PlaceInput& target) {
  const auto src = graph_->FindPlace(source.name, source.place_type, source.region);
  const auto tgt = graph_->FindPlace(target.name, target.place_type, target.region);
  if (!src || !tgt) return false;

  const auto key   = RouteKey(src->id, tgt->id);
  bool       found = cache_->Invalidate(key);

  auto tx     = repo_->Begin();
  auto result = repo_->DeleteRoute(*tx, src->id, tgt->id);
  if (result) {
    tx->Commit();
    found = true;
  } else if (result.code != db::ErrorCode::NotFound) {
    db::ThrowIfDbError(result, "delete route " + key);
  }

  ROADCAST_LOG_INFO("route invalidated", {StringField("key", key)});
  return found;
}

RouteCounters RouteCacheCoordinator::Stats() const {
  RouteCounters out;
  out.requests          = requests_.load();
  out.graph_hits        = graph_hits_.load();
  out.injections        = injections_.load();
  out.provider_failures = provider_failures_.load();
  return out;
}

} // namespace roadcast::core
