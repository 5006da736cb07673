#include "internal/graph/road_graph_store.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using roadcast::graph::EdgeInput;
using roadcast::graph::NearestNodeLocator;
using roadcast::graph::PlaceInput;
using roadcast::graph::RoadGraphStore;

struct Fixture {
  std::shared_ptr<roadcast::db::memory::MemoryRepository> repo = std::make_shared<roadcast::db::memory::MemoryRepository>();
  RoadGraphStore store{repo, std::make_shared<NearestNodeLocator>(), roadcast::config::GraphOptions{}};
};

PlaceInput Tehran() {
  return PlaceInput{"Tehran", "city", "IR", {35.6892, 51.3890}, "Asia/Tehran"};
}

void TestPlaceUpsertIsIdempotent() {
  Fixture f;
  const auto a = f.store.UpsertPlace(Tehran());
  const auto b = f.store.UpsertPlace(Tehran());
  assert(a.id == b.id);
  assert(f.store.Counts().places == 1);

  auto found = f.store.FindPlace("Tehran", "city", "IR");
  assert(found.has_value());
  assert(found->id == a.id);
  assert(found->time_zone == "Asia/Tehran");
}

void TestConcurrentPlaceUpsertsCollapse() {
  Fixture                   f;
  std::vector<std::thread>  threads;
  std::vector<std::int64_t> ids(8);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    threads.emplace_back([&, i] { ids[i] = f.store.UpsertPlace(Tehran()).id; });
  }
  for (auto& t : threads) t.join();

  assert(std::set<std::int64_t>(ids.begin(), ids.end()).size() == 1);
  assert(f.store.Counts().places == 1);
}

void TestNodesSnapWithinTolerance() {
  Fixture f;
  const auto a = f.store.UpsertNode({35.7000, 51.4000});
  const auto b = f.store.UpsertNode({35.70001, 51.40001}); // ~1.4 m away
  const auto c = f.store.UpsertNode({35.7100, 51.4000});
  assert(a == b);
  assert(a != c);
  assert(f.store.Counts().nodes == 2);
}

void TestAccessPointLink() {
  Fixture    f;
  const auto place = f.store.UpsertPlace(Tehran());
  const auto node  = f.store.UpsertNode({35.6892, 51.3890}, place.id, "Tehran");

  const auto access = f.store.AccessNodes(place.id);
  assert(access.size() == 1);
  assert(access[0] == node);
  assert(f.store.Counts().access_points == 1);
}

void TestAccessPointStaysWithFirstPlace() {
  Fixture    f;
  const auto tehran = f.store.UpsertPlace(Tehran());
  const auto rey    = f.store.UpsertPlace(PlaceInput{"Rey", "city", "IR", {35.5950, 51.4350}, "Asia/Tehran"});

  const auto node  = f.store.UpsertNode({35.6892, 51.3890}, tehran.id);
  const auto again = f.store.UpsertNode({35.6892, 51.3890}, rey.id);
  assert(again == node);

  assert(f.store.AccessNodes(tehran.id) == std::vector<std::int64_t>{node});
  assert(f.store.AccessNodes(rey.id).empty());
  assert(f.store.Node(node)->place_id == tehran.id);
}

void TestConcurrentNodeUpsertsCollapse() {
  Fixture                   f;
  std::vector<std::thread>  threads;
  std::vector<std::int64_t> ids(8);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    threads.emplace_back([&, i] { ids[i] = f.store.UpsertNode({35.7000, 51.4000}); });
  }
  for (auto& t : threads) t.join();

  assert(std::set<std::int64_t>(ids.begin(), ids.end()).size() == 1);
  assert(f.store.Counts().nodes == 1);
  assert(f.store.Locator().Size() == 1);
}

void TestConcurrentEdgeUpsertsCollapse() {
  Fixture    f;
  const auto a = f.store.UpsertNode({35.7000, 51.4000});
  const auto b = f.store.UpsertNode({35.7100, 51.4000});
  const EdgeInput edge{a, b, {{35.7000, 51.4000}, {35.7100, 51.4000}}, 1112.0, 60.0, "primary", "Valiasr"};

  std::vector<std::thread>  threads;
  std::vector<std::int64_t> ids(8);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    threads.emplace_back([&, i] { ids[i] = f.store.UpsertEdge(edge); });
  }
  for (auto& t : threads) t.join();

  assert(std::set<std::int64_t>(ids.begin(), ids.end()).size() == 1);
  assert(f.store.Counts().edges == 1);
  assert(f.store.Read([](const roadcast::graph::GraphArena& arena) { return arena.edges.size(); }) == 1);
}

void TestEdgeUpsertIsIdempotent() {
  Fixture    f;
  const auto a = f.store.UpsertNode({35.7000, 51.4000});
  const auto b = f.store.UpsertNode({35.7100, 51.4000});

  EdgeInput edge{a, b, {{35.7000, 51.4000}, {35.7100, 51.4000}}, 1112.0, 60.0, "primary", "Valiasr"};
  const auto first  = f.store.UpsertEdge(edge);
  const auto second = f.store.UpsertEdge(edge);
  assert(first == second);
  assert(f.store.Counts().edges == 1);

  f.store.Read([&](const roadcast::graph::GraphArena& arena) {
    assert(arena.edges.size() == 1);
    assert(arena.edges[0].duration_s > 66.0 && arena.edges[0].duration_s < 67.0);
  });
}

void TestZeroSpeedIsRejectedAndNotPersisted() {
  Fixture    f;
  const auto a = f.store.UpsertNode({35.7000, 51.4000});
  const auto b = f.store.UpsertNode({35.7100, 51.4000});

  bool threw = false;
  try {
    f.store.UpsertEdge(EdgeInput{a, b, {}, 1112.0, 0.0, "primary", ""});
  } catch (const roadcast::util::Invalid&) {
    threw = true;
  }
  assert(threw);
  assert(f.store.Counts().edges == 0);

  auto tx = f.repo->Begin();
  assert(!f.repo->GetEdge(*tx, a, b).has_value());
  tx->Commit();
}

void TestBadEdgesAreRejected() {
  Fixture    f;
  const auto a = f.store.UpsertNode({35.7000, 51.4000});

  bool self_loop = false;
  try {
    f.store.UpsertEdge(EdgeInput{a, a, {}, 10.0, 50.0, "", ""});
  } catch (const roadcast::util::Invalid&) {
    self_loop = true;
  }
  assert(self_loop);

  bool unknown = false;
  try {
    f.store.UpsertEdge(EdgeInput{a, 999999, {}, 10.0, 50.0, "", ""});
  } catch (const roadcast::util::NotFound&) {
    unknown = true;
  }
  assert(unknown);

  bool negative = false;
  try {
    f.store.UpsertEdge(EdgeInput{a, 999999, {}, -5.0, 50.0, "", ""});
  } catch (const roadcast::util::Invalid&) {
    negative = true;
  }
  assert(negative);
}

void TestReloadRebuildsFromRepository() {
  auto       repo = std::make_shared<roadcast::db::memory::MemoryRepository>();
  std::int64_t a = 0;
  {
    RoadGraphStore writer(repo, std::make_shared<NearestNodeLocator>(), roadcast::config::GraphOptions{});
    a      = writer.UpsertNode({35.7000, 51.4000});
    auto b = writer.UpsertNode({35.7100, 51.4000});
    writer.UpsertEdge(EdgeInput{a, b, {}, 1112.0, 60.0, "primary", ""});
  }

  RoadGraphStore reader(repo, std::make_shared<NearestNodeLocator>(), roadcast::config::GraphOptions{});
  assert(!reader.Node(a).has_value());
  reader.Reload();
  assert(reader.Node(a).has_value());
  assert(reader.Locator().Size() == 2);
  assert(reader.Read([](const roadcast::graph::GraphArena& arena) { return arena.edges.size(); }) == 1);
}

} // namespace

int main() {
  TestPlaceUpsertIsIdempotent();
  TestConcurrentPlaceUpsertsCollapse();
  TestNodesSnapWithinTolerance();
  TestAccessPointLink();
  TestAccessPointStaysWithFirstPlace();
  TestConcurrentNodeUpsertsCollapse();
  TestConcurrentEdgeUpsertsCollapse();
  TestEdgeUpsertIsIdempotent();
  TestZeroSpeedIsRejectedAndNotPersisted();
  TestBadEdgesAreRejected();
  TestReloadRebuildsFromRepository();

  std::cout << "road_graph_store_test: pass" << std::endl;
  return 0;
}
