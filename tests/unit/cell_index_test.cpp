#include "internal/spatial/cell_index.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using roadcast::spatial::SpatialCellIndex;

void TestEncodeIsDeterministic() {
  SpatialCellIndex index(7);

  const auto a = index.Encode(35.6892, 51.3890);
  const auto b = index.Encode(35.6892, 51.3890);
  assert(a == b);
  assert(SpatialCellIndex::Encode(35.6892, 51.3890, 7) == a);

  // A second index with the same resolution agrees.
  SpatialCellIndex other(7);
  assert(other.Encode({35.6892, 51.3890}) == a);
}

void TestResolutionChangesCell() {
  SpatialCellIndex coarse(5);
  SpatialCellIndex fine(9);
  assert(coarse.Encode(35.6892, 51.3890) != fine.Encode(35.6892, 51.3890));
}

void TestCenterMapsBackToCell() {
  SpatialCellIndex index(7);
  const auto       cell   = index.Encode(36.2605, 59.6168);
  const auto       center = index.Center(cell);
  assert(index.Encode(center) == cell);
}

void TestNeighborsRing() {
  SpatialCellIndex index(7);
  const auto       cell = index.Encode(35.6892, 51.3890);

  const auto ring0 = index.Neighbors(cell, 0);
  assert(ring0.size() == 1);
  assert(ring0.count(cell) == 1);

  const auto ring1 = index.Neighbors(cell, 1);
  assert(ring1.size() == 7);
  assert(ring1.count(cell) == 1);
}

void TestStringRoundTrip() {
  SpatialCellIndex index(7);
  const auto       cell = index.Encode(35.6892, 51.3890);
  const auto       text = SpatialCellIndex::ToString(cell);
  assert(!text.empty());
  assert(SpatialCellIndex::FromString(text) == cell);
}

void TestRejectsBadInput() {
  SpatialCellIndex index(7);

  bool threw = false;
  try {
    index.Encode(91.0, 10.0);
  } catch (const roadcast::util::Invalid&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    SpatialCellIndex bad(16);
  } catch (const roadcast::util::Invalid&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    SpatialCellIndex::FromString("not-a-cell");
  } catch (const roadcast::util::Invalid&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncodeIsDeterministic();
  TestResolutionChangesCell();
  TestCenterMapsBackToCell();
  TestNeighborsRing();
  TestStringRoundTrip();
  TestRejectsBadInput();

  std::cout << "cell_index_test: pass" << std::endl;
  return 0;
}
