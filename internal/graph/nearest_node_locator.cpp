#include "nearest_node_locator.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <mutex>

namespace roadcast::graph {

namespace {

constexpr double kDegToRad = M_PI / 180.0;

// Great-circle metres for a chord on the unit sphere.
double ChordToMeters(double chord) {
  return 2.0 * spatial::kEarthRadiusMeters * std::asin(std::min(1.0, chord / 2.0));
}

} // namespace

NearestNodeLocator::Point NearestNodeLocator::ToPoint(const spatial::Coordinate& at) {
  const double lat = at.lat * kDegToRad;
  const double lon = at.lon * kDegToRad;
  return Point(std::cos(lat) * std::cos(lon), std::cos(lat) * std::sin(lon), std::sin(lat));
}

std::optional<NodeId> NearestNodeLocator::Nearest(const spatial::Coordinate& at, double max_radius_m) const {
  auto hits = Within(at, max_radius_m, 1);
  if (hits.empty()) return std::nullopt;
  return hits.front().first;
}

std::vector<std::pair<NodeId, double>> NearestNodeLocator::Within(const spatial::Coordinate& at, double radius_m, std::size_t limit) const {
  if (limit == 0) return {};

  const Point        origin = ToPoint(at);
  std::vector<Value> candidates;
  {
    std::shared_lock lock(mutex_);
    tree_.query(bgi::nearest(origin, static_cast<unsigned>(limit)), std::back_inserter(candidates));
  }

  std::vector<std::pair<NodeId, double>> out;
  for (const auto& [point, id] : candidates) {
    const double d = ChordToMeters(bg::distance(origin, point));
    if (d <= radius_m) out.emplace_back(id, d);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.second != b.second ? a.second < b.second : a.first < b.first;
  });
  return out;
}

void NearestNodeLocator::Insert(NodeId id, const spatial::Coordinate& at) {
  std::unique_lock lock(mutex_);
  tree_.insert(Value(ToPoint(at), id));
}

void NearestNodeLocator::Rebuild(const std::vector<std::pair<NodeId, spatial::Coordinate>>& nodes) {
  std::vector<Value> values;
  values.reserve(nodes.size());
  for (const auto& [id, at] : nodes) {
    values.emplace_back(ToPoint(at), id);
  }

  // Packing constructor; much faster than repeated insert.
  Tree fresh(values.begin(), values.end());

  std::unique_lock lock(mutex_);
  tree_ = std::move(fresh);
}

std::size_t NearestNodeLocator::Size() const {
  std::shared_lock lock(mutex_);
  return tree_.size();
}

} // namespace roadcast::graph
