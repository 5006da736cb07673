#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/spatial/geo.hpp"
#include "nearest_node_locator.hpp"

namespace roadcast::graph {

using EdgeId  = std::int64_t;
using PlaceId = std::int64_t;

struct GraphNode {
  NodeId                 id = 0;
  spatial::Coordinate    coord;
  std::optional<PlaceId> place_id;
};

struct GraphEdge {
  EdgeId id         = 0;
  NodeId source     = 0;
  NodeId target     = 0;
  double distance_m = 0.0;
  double duration_s = 0.0;
};

/*
  In-memory arena mirroring the persisted graph.

  Nodes and edges live in flat vectors and refer to each other by id; the
  index maps translate ids to slots. out_edges[i] lists the slots in edges
  leaving nodes[i].
*/
struct GraphArena {
  std::vector<GraphNode>                           nodes;
  std::vector<GraphEdge>                           edges;
  std::vector<std::vector<std::size_t>>            out_edges;
  std::unordered_map<NodeId, std::size_t>          node_slot;
  std::unordered_map<EdgeId, std::size_t>          edge_slot;
  std::unordered_map<PlaceId, std::vector<NodeId>> access_nodes;

  const GraphNode* FindNode(NodeId id) const {
    auto it = node_slot.find(id);
    return it == node_slot.end() ? nullptr : &nodes[it->second];
  }
};

// Travel time for a segment at constant speed.
inline double DurationSeconds(double distance_m, double speed_kmh) {
  return distance_m / (speed_kmh / 3.6);
}

} // namespace roadcast::graph
