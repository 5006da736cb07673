#pragma once

#include <optional>
#include <vector>

#include "road_graph_store.hpp"

namespace roadcast::graph {

struct Path {
  std::vector<NodeId> nodes;
  double              distance_m = 0.0;
  double              duration_s = 0.0;
};

/*
  PathFinder

  Dijkstra over the store's arena with cost = edge duration. Equal-duration
  candidates are ordered by total distance, then by node id, so the same
  graph always yields the same path. O((V + E) log V).
*/
class PathFinder {
 public:
  explicit PathFinder(const RoadGraphStore& store) : store_(store) {
  }

  // nullopt when either node is unknown or target is unreachable.
  std::optional<Path> ShortestPath(NodeId source, NodeId target) const;

  // One search seeded with every source at cost 0; stops at the first target
  // settled, so the result is the cheapest pair overall. Nodes listed on both
  // sides are ignored as targets.
  std::optional<Path> ShortestPath(const std::vector<NodeId>& sources, const std::vector<NodeId>& targets) const;

 private:
  const RoadGraphStore& store_;
};

} // namespace roadcast::graph
