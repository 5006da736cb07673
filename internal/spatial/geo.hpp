#pragma once

#include <vector>

namespace roadcast::spatial {

struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
};

inline bool operator==(const Coordinate& a, const Coordinate& b) {
  return a.lat == b.lat && a.lon == b.lon;
}

constexpr double kEarthRadiusMeters = 6371000.0;

bool IsValid(const Coordinate& c);

// Great-circle distance in metres.
double HaversineMeters(const Coordinate& a, const Coordinate& b);

double PathLengthMeters(const std::vector<Coordinate>& path);

/*
  Resamples a polyline so consecutive points are roughly interval_m apart
  along the path. First and last input points are always kept.
*/
std::vector<Coordinate> SampleEvery(const std::vector<Coordinate>& path, double interval_m);

} // namespace roadcast::spatial
