#include "path_finder.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <tuple>

namespace roadcast::graph {

namespace {

constexpr std::size_t kNoSlot = std::numeric_limits<std::size_t>::max();

struct Cost {
  double duration = std::numeric_limits<double>::infinity();
  double distance = std::numeric_limits<double>::infinity();

  bool operator<(const Cost& o) const {
    return std::tie(duration, distance) < std::tie(o.duration, o.distance);
  }
  bool operator==(const Cost& o) const {
    return duration == o.duration && distance == o.distance;
  }
};

struct PQEntry {
  Cost        cost;
  NodeId      node;
  std::size_t slot;

  bool operator>(const PQEntry& o) const {
    return std::tie(cost.duration, cost.distance, node) > std::tie(o.cost.duration, o.cost.distance, o.node);
  }
};

using MinHeap = std::priority_queue<PQEntry, std::vector<PQEntry>, std::greater<PQEntry>>;

} // namespace

std::optional<Path> PathFinder::ShortestPath(NodeId source, NodeId target) const {
  if (source == target) {
    return store_.Read([&](const GraphArena& arena) -> std::optional<Path> {
      if (arena.node_slot.count(source) == 0) return std::nullopt;
      return Path{{source}, 0.0, 0.0};
    });
  }
  return ShortestPath(std::vector<NodeId>{source}, std::vector<NodeId>{target});
}

std::optional<Path> PathFinder::ShortestPath(const std::vector<NodeId>& sources, const std::vector<NodeId>& targets) const {
  return store_.Read([&](const GraphArena& arena) -> std::optional<Path> {
    const std::size_t n = arena.nodes.size();
    std::vector<Cost>        best(n);
    std::vector<std::size_t> parent(n, kNoSlot);
    std::vector<bool>        settled(n, false);
    std::vector<bool>        is_source(n, false);
    std::vector<bool>        is_target(n, false);

    MinHeap pq;
    for (NodeId id : sources) {
      auto it = arena.node_slot.find(id);
      if (it == arena.node_slot.end() || is_source[it->second]) continue;
      is_source[it->second] = true;
      best[it->second]      = Cost{0.0, 0.0};
      pq.push({best[it->second], id, it->second});
    }

    bool any_target = false;
    for (NodeId id : targets) {
      auto it = arena.node_slot.find(id);
      // A node on both sides would yield an empty route.
      if (it == arena.node_slot.end() || is_source[it->second]) continue;
      is_target[it->second] = true;
      any_target            = true;
    }
    if (pq.empty() || !any_target) {
      return std::nullopt;
    }

    std::size_t reached = kNoSlot;
    while (!pq.empty()) {
      auto [cost, node, u] = pq.top();
      pq.pop();

      if (settled[u]) continue;
      settled[u] = true;

      if (is_target[u]) {
        reached = u;
        break;
      }

      for (std::size_t e : arena.out_edges[u]) {
        const auto& edge = arena.edges[e];
        auto        it   = arena.node_slot.find(edge.target);
        if (it == arena.node_slot.end()) continue;

        const std::size_t v = it->second;
        if (settled[v]) continue;

        const Cost next{cost.duration + edge.duration_s, cost.distance + edge.distance_m};
        const bool better = next < best[v];
        // Exact tie: keep the predecessor with the lower node id.
        const bool tie_wins = next == best[v] && parent[v] != kNoSlot && arena.nodes[u].id < arena.nodes[parent[v]].id;
        if (better || tie_wins) {
          best[v]   = next;
          parent[v] = u;
          if (better) pq.push({next, edge.target, v});
        }
      }
    }

    if (reached == kNoSlot) {
      return std::nullopt;
    }

    Path path;
    path.duration_s = best[reached].duration;
    path.distance_m = best[reached].distance;
    for (std::size_t at = reached; at != kNoSlot; at = parent[at]) {
      path.nodes.push_back(arena.nodes[at].id);
    }
    std::reverse(path.nodes.begin(), path.nodes.end());
    return path;
  });
}

} // namespace roadcast::graph
