#include "geo.hpp"

#include <cmath>

namespace roadcast::spatial {

namespace {

constexpr double kDegToRad = M_PI / 180.0;

Coordinate Lerp(const Coordinate& a, const Coordinate& b, double t) {
  return {a.lat + (b.lat - a.lat) * t, a.lon + (b.lon - a.lon) * t};
}

} // namespace

bool IsValid(const Coordinate& c) {
  return std::isfinite(c.lat) && std::isfinite(c.lon) && c.lat >= -90.0 && c.lat <= 90.0 && c.lon >= -180.0 && c.lon <= 180.0;
}

double HaversineMeters(const Coordinate& a, const Coordinate& b) {
  const double dlat = (b.lat - a.lat) * kDegToRad;
  const double dlon = (b.lon - a.lon) * kDegToRad;
  const double h    = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(a.lat * kDegToRad) * std::cos(b.lat * kDegToRad) * std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2.0 * kEarthRadiusMeters * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double PathLengthMeters(const std::vector<Coordinate>& path) {
  double total = 0.0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    total += HaversineMeters(path[i - 1], path[i]);
  }
  return total;
}

std::vector<Coordinate> SampleEvery(const std::vector<Coordinate>& path, double interval_m) {
  if (path.size() < 2 || interval_m <= 0) {
    return path;
  }

  std::vector<Coordinate> out;
  out.push_back(path.front());

  double carried = 0.0; // distance walked since the last emitted sample
  for (std::size_t i = 1; i < path.size(); ++i) {
    const auto&  from    = path[i - 1];
    const auto&  to      = path[i];
    const double segment = HaversineMeters(from, to);
    if (segment <= 0.0) {
      continue;
    }

    double offset = interval_m - carried;
    while (offset < segment) {
      out.push_back(Lerp(from, to, offset / segment));
      offset += interval_m;
    }
    carried = segment - (offset - interval_m);
  }

  if (!(out.back() == path.back())) {
    out.push_back(path.back());
  }
  return out;
}

} // namespace roadcast::spatial
