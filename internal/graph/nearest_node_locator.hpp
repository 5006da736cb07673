#pragma once

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/index/rtree.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "internal/spatial/geo.hpp"

namespace roadcast::graph {

namespace bg  = boost::geometry;
namespace bgi = boost::geometry::index;

using NodeId = std::int64_t;

/*
  NearestNodeLocator

  R-tree over node positions on the unit sphere (x, y, z). Chord length is
  monotonic in great-circle distance, so the tree's nearest query ranks
  nodes exactly as the haversine distance would at any latitude.

  Readers share the tree; Insert and Rebuild take it exclusively.
*/
class NearestNodeLocator {
 public:
  std::optional<NodeId> Nearest(const spatial::Coordinate& at, double max_radius_m) const;

  // Up to limit nodes within radius, nearest first.
  std::vector<std::pair<NodeId, double>> Within(const spatial::Coordinate& at, double radius_m, std::size_t limit) const;

  void Insert(NodeId id, const spatial::Coordinate& at);

  // Replaces the whole index; used for full reloads.
  void Rebuild(const std::vector<std::pair<NodeId, spatial::Coordinate>>& nodes);

  std::size_t Size() const;

 private:
  using Point = bg::model::point<double, 3, bg::cs::cartesian>;
  using Value = std::pair<Point, NodeId>;
  using Tree  = bgi::rtree<Value, bgi::quadratic<16>>;

  static Point ToPoint(const spatial::Coordinate& at);

  mutable std::shared_mutex mutex_;
  Tree                      tree_;
};

} // namespace roadcast::graph
