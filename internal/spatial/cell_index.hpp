#pragma once

#include <cstdint>
#include <set>
#include <string>

#include "geo.hpp"

namespace roadcast::spatial {

using CellId = std::uint64_t;

/*
  SpatialCellIndex

  Hexagonal H3 cells at one resolution fixed for the deployment. Cache keys
  embed the cell id, so the resolution must never change under a live cache.

  Pure and thread-safe.
*/
class SpatialCellIndex {
 public:
  explicit SpatialCellIndex(int resolution);

  int Resolution() const {
    return resolution_;
  }

  // Throws util::Invalid for out-of-range coordinates or resolution.
  static CellId Encode(double lat, double lon, int resolution);

  CellId Encode(double lat, double lon) const;
  CellId Encode(const Coordinate& c) const;

  // All cells within grid distance k of the cell, the cell itself included.
  std::set<CellId> Neighbors(CellId cell, int k) const;

  Coordinate Center(CellId cell) const;

  static std::string ToString(CellId cell);
  static CellId      FromString(const std::string& text);

 private:
  int resolution_;
};

} // namespace roadcast::spatial
