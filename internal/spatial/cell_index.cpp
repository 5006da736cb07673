#include "cell_index.hpp"

#include <h3/h3api.h>

#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace roadcast::spatial {

namespace {

void CheckResolution(int resolution) {
  if (resolution < 0 || resolution > 15) {
    throw util::Invalid("cell resolution out of range: " + std::to_string(resolution));
  }
}

} // namespace

SpatialCellIndex::SpatialCellIndex(int resolution) : resolution_(resolution) {
  CheckResolution(resolution);
}

CellId SpatialCellIndex::Encode(double lat, double lon, int resolution) {
  CheckResolution(resolution);
  if (!IsValid({lat, lon})) {
    throw util::Invalid("coordinate out of range");
  }

  LatLng ll;
  ll.lat = degsToRads(lat);
  ll.lng = degsToRads(lon);

  H3Index cell = 0;
  if (latLngToCell(&ll, resolution, &cell) != E_SUCCESS) {
    throw util::Invalid("cannot index coordinate");
  }
  return cell;
}

CellId SpatialCellIndex::Encode(double lat, double lon) const {
  return Encode(lat, lon, resolution_);
}

CellId SpatialCellIndex::Encode(const Coordinate& c) const {
  return Encode(c.lat, c.lon, resolution_);
}

std::set<CellId> SpatialCellIndex::Neighbors(CellId cell, int k) const {
  if (!isValidCell(cell)) {
    throw util::Invalid("invalid cell id");
  }
  if (k < 0) {
    throw util::Invalid("negative ring size");
  }

  int64_t disk_size = 0;
  if (maxGridDiskSize(k, &disk_size) != E_SUCCESS) {
    throw util::Invalid("ring size too large");
  }

  std::vector<H3Index> disk(static_cast<std::size_t>(disk_size), 0);
  if (gridDisk(cell, k, disk.data()) != E_SUCCESS) {
    throw util::Invalid("cannot expand cell ring");
  }

  std::set<CellId> out;
  for (auto c : disk) {
    if (c != 0) out.insert(c);
  }
  return out;
}

Coordinate SpatialCellIndex::Center(CellId cell) const {
  LatLng ll;
  if (cellToLatLng(cell, &ll) != E_SUCCESS) {
    throw util::Invalid("invalid cell id");
  }
  return {radsToDegs(ll.lat), radsToDegs(ll.lng)};
}

std::string SpatialCellIndex::ToString(CellId cell) {
  char buf[17] = {0};
  if (h3ToString(cell, buf, sizeof(buf)) != E_SUCCESS) {
    throw util::Invalid("invalid cell id");
  }
  return buf;
}

CellId SpatialCellIndex::FromString(const std::string& text) {
  H3Index cell = 0;
  if (stringToH3(text.c_str(), &cell) != E_SUCCESS || !isValidCell(cell)) {
    throw util::Invalid("invalid cell string: " + text);
  }
  return cell;
}

} // namespace roadcast::spatial
