#include "internal/graph/path_finder.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/road_graph_store.hpp"

namespace {

using roadcast::graph::EdgeInput;
using roadcast::graph::NodeId;
using roadcast::graph::PathFinder;
using roadcast::graph::RoadGraphStore;

struct Fixture {
  RoadGraphStore store{std::make_shared<roadcast::db::memory::MemoryRepository>(), std::make_shared<roadcast::graph::NearestNodeLocator>(),
                       roadcast::config::GraphOptions{}};
  PathFinder     finder{store};

  NodeId Node(double lat, double lon) {
    return store.UpsertNode({lat, lon});
  }

  void Edge(NodeId a, NodeId b, double distance_m, double speed_kmh) {
    store.UpsertEdge(EdgeInput{a, b, {}, distance_m, speed_kmh, "", ""});
  }
};

void TestPrefersFasterOverShorter() {
  Fixture    f;
  const auto a = f.Node(35.00, 51.00);
  const auto b = f.Node(35.01, 51.00);
  const auto d = f.Node(35.02, 51.00);

  // Short but slow.
  f.Edge(a, b, 1000.0, 10.0);
  f.Edge(b, d, 1000.0, 10.0);
  // Long but fast.
  f.Edge(a, d, 3000.0, 100.0);

  auto path = f.finder.ShortestPath(a, d);
  assert(path.has_value());
  assert(path->nodes.size() == 2);
  assert(path->nodes.front() == a && path->nodes.back() == d);
  assert(path->distance_m == 3000.0);
}

void TestExactTieKeepsLowerIdPredecessor() {
  Fixture    f;
  const auto a = f.Node(35.00, 51.00);
  const auto b = f.Node(35.01, 51.00);
  const auto c = f.Node(35.01, 51.01);
  const auto d = f.Node(35.02, 51.00);

  f.Edge(a, b, 1000.0, 36.0);
  f.Edge(a, c, 1000.0, 36.0);
  f.Edge(c, d, 1000.0, 36.0);
  f.Edge(b, d, 1000.0, 36.0);

  auto path = f.finder.ShortestPath(a, d);
  assert(path.has_value());
  assert(path->nodes.size() == 3);
  assert(path->nodes[1] == std::min(b, c));

  // Deterministic across runs over the same graph.
  auto again = f.finder.ShortestPath(a, d);
  assert(again->nodes == path->nodes);
}

void TestEdgesAreDirected() {
  Fixture    f;
  const auto a = f.Node(35.00, 51.00);
  const auto b = f.Node(35.01, 51.00);
  f.Edge(a, b, 1000.0, 50.0);

  assert(f.finder.ShortestPath(a, b).has_value());
  assert(!f.finder.ShortestPath(b, a).has_value());
}

void TestUnknownAndTrivialPaths() {
  Fixture    f;
  const auto a = f.Node(35.00, 51.00);

  assert(!f.finder.ShortestPath(a, 424242).has_value());

  auto self = f.finder.ShortestPath(a, a);
  assert(self.has_value());
  assert(self->nodes.size() == 1);
  assert(self->duration_s == 0.0);
}

void TestTotalsAccumulate() {
  Fixture    f;
  const auto a = f.Node(35.00, 51.00);
  const auto b = f.Node(35.01, 51.00);
  const auto c = f.Node(35.02, 51.00);
  f.Edge(a, b, 1200.0, 72.0); // 60 s
  f.Edge(b, c, 800.0, 72.0);  // 40 s

  auto path = f.finder.ShortestPath(a, c);
  assert(path.has_value());
  assert(path->distance_m == 2000.0);
  assert(path->duration_s > 99.99 && path->duration_s < 100.01);
}

void TestMultipleSourcesPickCheapestPair() {
  Fixture    f;
  const auto s1 = f.Node(35.00, 51.00);
  const auto s2 = f.Node(35.00, 51.10);
  const auto t1 = f.Node(35.10, 51.00);
  const auto t2 = f.Node(35.10, 51.10);
  const auto m  = f.Node(35.05, 51.05);

  f.Edge(s1, t1, 10000.0, 50.0); // 720 s
  f.Edge(s2, m, 5000.0, 100.0);  // 180 s
  f.Edge(m, t2, 5000.0, 100.0);  // 180 s

  auto path = f.finder.ShortestPath(std::vector<NodeId>{s1, s2}, std::vector<NodeId>{t1, t2});
  assert(path.has_value());
  assert(path->nodes == (std::vector<NodeId>{s2, m, t2}));
  assert(path->duration_s > 359.99 && path->duration_s < 360.01);

  // Unreachable target set.
  assert(!f.finder.ShortestPath(std::vector<NodeId>{t1, t2}, std::vector<NodeId>{s1, s2}).has_value());
}

void TestSharedNodeIsNotAnEmptyRoute() {
  Fixture    f;
  const auto a = f.Node(35.00, 51.00);
  const auto b = f.Node(35.01, 51.00);
  f.Edge(a, b, 1000.0, 60.0);

  // a on both sides must not yield the zero-length route a -> a.
  auto path = f.finder.ShortestPath(std::vector<NodeId>{a}, std::vector<NodeId>{a, b});
  assert(path.has_value());
  assert(path->nodes == (std::vector<NodeId>{a, b}));

  assert(!f.finder.ShortestPath(std::vector<NodeId>{a}, std::vector<NodeId>{a}).has_value());
  assert(!f.finder.ShortestPath(std::vector<NodeId>{}, std::vector<NodeId>{b}).has_value());
}

} // namespace

int main() {
  TestPrefersFasterOverShorter();
  TestExactTieKeepsLowerIdPredecessor();
  TestEdgesAreDirected();
  TestUnknownAndTrivialPaths();
  TestTotalsAccumulate();
  TestMultipleSourcesPickCheapestPair();
  TestSharedNodeIsNotAnEmptyRoute();

  std::cout << "path_finder_test: pass" << std::endl;
  return 0;
}
