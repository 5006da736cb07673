#include "route_injector.hpp"

#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace roadcast::graph {

using roadcast::observability::IntField;

double RoadClassSpeed(const std::string& road_type, double fallback_kmh) {
  static const std::unordered_map<std::string, double> kSpeeds = {
      {"motorway", 100.0}, {"trunk", 90.0},       {"primary", 80.0}, {"secondary", 60.0},
      {"tertiary", 50.0},  {"residential", 30.0}, {"service", 20.0},
  };

  auto it = kSpeeds.find(road_type);
  return it == kSpeeds.end() ? fallback_kmh : it->second;
}

namespace {

// Step covering the point along_m metres into the route; null without steps.
const providers::RouteStep* StepAt(const providers::RouteGeometry& route, double along_m) {
  double walked = 0.0;
  for (const auto& step : route.steps) {
    walked += step.distance_m;
    if (along_m <= walked) return &step;
  }
  return route.steps.empty() ? nullptr : &route.steps.back();
}

} // namespace

double RouteInjector::SpeedAt(const providers::RouteGeometry& route, double along_m) const {
  const double fallback = store_.Options().default_speed_kmh;

  if (const auto* step = StepAt(route, along_m)) {
    return RoadClassSpeed(step->road_type, fallback);
  }
  if (route.distance_km > 0.0 && route.duration_hours > 0.0) {
    return route.distance_km / route.duration_hours;
  }
  return fallback;
}

InjectionResult RouteInjector::Inject(const providers::RouteGeometry& route, PlaceId source_place, PlaceId target_place) {
  if (route.points.size() < 2) {
    throw util::Invalid("route geometry needs at least two points");
  }

  const auto samples = spatial::SampleEvery(route.points, store_.Options().sample_interval_m);

  InjectionResult result;
  std::vector<spatial::Coordinate> kept; // sample coordinate for each entry in result.nodes
  std::vector<double>              along;

  double walked = 0.0;
  for (std::size_t i = 0; i < samples.size(); ++i) {
    if (i > 0) walked += spatial::HaversineMeters(samples[i - 1], samples[i]);

    std::optional<PlaceId> place;
    if (i == 0) place = source_place;
    if (i + 1 == samples.size()) place = target_place;

    const NodeId id = store_.UpsertNode(samples[i], place);
    if (!result.nodes.empty() && result.nodes.back() == id) continue;

    result.nodes.push_back(id);
    kept.push_back(samples[i]);
    along.push_back(walked);
  }

  for (std::size_t i = 1; i < result.nodes.size(); ++i) {
    const double distance = spatial::HaversineMeters(kept[i - 1], kept[i]);
    if (distance <= 0.0) continue;

    const double mid  = (along[i - 1] + along[i]) / 2.0;
    const auto*  step = StepAt(route, mid);

    EdgeInput edge;
    edge.source     = result.nodes[i - 1];
    edge.target     = result.nodes[i];
    edge.geometry   = {kept[i - 1], kept[i]};
    edge.distance_m = distance;
    edge.speed_kmh  = SpeedAt(route, mid);
    if (step) {
      edge.road_type = step->road_type;
      edge.road_name = step->road_name;
    }
    store_.UpsertEdge(edge);
    ++result.edges;
  }

  ROADCAST_LOG_INFO("route injected into graph", {IntField("source_place", source_place), IntField("target_place", target_place),
                                                  IntField("nodes", static_cast<std::int64_t>(result.nodes.size())),
                                                  IntField("edges", static_cast<std::int64_t>(result.edges))});
  return result;
}

} // namespace roadcast::graph
