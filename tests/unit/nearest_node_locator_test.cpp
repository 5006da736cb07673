#include "internal/graph/nearest_node_locator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using roadcast::graph::NearestNodeLocator;

void TestNearestWithinRadius() {
  NearestNodeLocator locator;
  locator.Insert(1, {35.7000, 51.4000});
  locator.Insert(2, {35.7100, 51.4000}); // about 1.1 km north
  locator.Insert(3, {36.2600, 59.6100}); // Mashhad

  auto hit = locator.Nearest({35.7001, 51.4001}, 50.0);
  assert(hit.has_value());
  assert(*hit == 1);

  // Nothing within 10 m of a point 500 m away from both nodes.
  assert(!locator.Nearest({35.7050, 51.4000}, 10.0).has_value());
  assert(locator.Size() == 3);
}

void TestWithinIsSortedAndLimited() {
  NearestNodeLocator locator;
  locator.Insert(10, {35.7000, 51.4000});
  locator.Insert(11, {35.7020, 51.4000});
  locator.Insert(12, {35.7040, 51.4000});
  locator.Insert(13, {35.8000, 51.4000}); // 11 km away

  const auto found = locator.Within({35.7000, 51.4000}, 1000.0, 10);
  assert(found.size() == 3);
  assert(found[0].first == 10);
  assert(found[1].first == 11);
  assert(found[2].first == 12);
  assert(found[0].second <= found[1].second && found[1].second <= found[2].second);

  const auto limited = locator.Within({35.7000, 51.4000}, 1000.0, 2);
  assert(limited.size() == 2);
  assert(limited[1].first == 11);
}

void TestEastWestNeighbourAtHighLatitude() {
  NearestNodeLocator locator;
  const roadcast::spatial::Coordinate origin{60.0, 25.0};

  // In raw degrees the northern cluster is closer; on the ground the
  // single eastern node is (0.015 deg of longitude at 60N is about 835 m).
  for (int i = 0; i < 9; ++i) {
    locator.Insert(100 + i, {60.0080 + i * 0.0001, 25.0});
  }
  locator.Insert(7, {60.0, 25.0150});

  auto hit = locator.Nearest(origin, 5000.0);
  assert(hit.has_value());
  assert(*hit == 7);

  const auto found = locator.Within(origin, 5000.0, 1);
  assert(found.size() == 1);
  const double expected = roadcast::spatial::HaversineMeters(origin, {60.0, 25.0150});
  assert(std::abs(found[0].second - expected) < 1.0);
}

void TestRebuildReplacesIndex() {
  NearestNodeLocator locator;
  locator.Insert(1, {10.0, 10.0});
  locator.Rebuild({{5, {20.0, 20.0}}, {6, {20.001, 20.0}}});

  assert(locator.Size() == 2);
  assert(!locator.Nearest({10.0, 10.0}, 100.0).has_value());
  assert(*locator.Nearest({20.0, 20.0}, 100.0) == 5);
}

} // namespace

int main() {
  TestNearestWithinRadius();
  TestWithinIsSortedAndLimited();
  TestEastWestNeighbourAtHighLatitude();
  TestRebuildReplacesIndex();

  std::cout << "nearest_node_locator_test: pass" << std::endl;
  return 0;
}
