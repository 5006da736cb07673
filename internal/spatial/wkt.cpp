#include "wkt.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/point.hpp>

#include <sstream>

#include "internal/util/errors.hpp"

namespace roadcast::spatial {

namespace bg = boost::geometry;

namespace {
using WktPoint      = bg::model::point<double, 2, bg::cs::cartesian>;
using WktLinestring = bg::model::linestring<WktPoint>;
} // namespace

std::string ToWkt(const std::vector<Coordinate>& path) {
  WktLinestring line;
  for (const auto& c : path) {
    bg::append(line, WktPoint(c.lon, c.lat));
  }

  std::ostringstream out;
  out.precision(9);
  out << bg::wkt(line);
  return out.str();
}

std::vector<Coordinate> FromWkt(const std::string& wkt) {
  WktLinestring line;
  try {
    bg::read_wkt(wkt, line);
  } catch (const bg::read_wkt_exception& e) {
    throw util::Invalid(std::string("bad geometry: ") + e.what());
  }

  std::vector<Coordinate> out;
  out.reserve(line.size());
  for (const auto& p : line) {
    out.push_back({bg::get<1>(p), bg::get<0>(p)});
  }
  return out;
}

} // namespace roadcast::spatial
