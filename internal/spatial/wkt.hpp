#pragma once

#include <string>
#include <vector>

#include "geo.hpp"

namespace roadcast::spatial {

// LINESTRING(lon lat, ...) as stored in edges.geometry.
std::string ToWkt(const std::vector<Coordinate>& path);

// Throws util::Invalid on malformed input.
std::vector<Coordinate> FromWkt(const std::string& wkt);

} // namespace roadcast::spatial
