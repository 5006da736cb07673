#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/providers/providers.hpp"
#include "road_graph_store.hpp"

namespace roadcast::graph {

struct InjectionResult {
  std::vector<NodeId> nodes;
  std::size_t         edges = 0;
};

// km/h by road class; unknown classes get fallback_kmh.
double RoadClassSpeed(const std::string& road_type, double fallback_kmh);

/*
  Turns a provider route into graph nodes and edges.

  The geometry is resampled every sample_interval_m; each sample goes
  through UpsertNode (so it snaps onto nearby existing nodes) and each
  consecutive pair of distinct nodes becomes an edge. The first and last
  nodes become access points of the source and target places.
*/
class RouteInjector {
 public:
  explicit RouteInjector(RoadGraphStore& store) : store_(store) {
  }

  // Throws util::Invalid for geometry with fewer than two points.
  InjectionResult Inject(const providers::RouteGeometry& route, PlaceId source_place, PlaceId target_place);

 private:
  double SpeedAt(const providers::RouteGeometry& route, double along_m) const;

  RoadGraphStore& store_;
};

} // namespace roadcast::graph
