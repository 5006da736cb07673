#pragma once

#include <cstdint>
#include <string>

namespace roadcast::db::model {

struct EdgeRecord {
  std::int64_t id          = 0;
  std::int64_t source_node = 0;
  std::int64_t target_node = 0;

  double distance_m    = 0.0;
  double max_speed_kmh = 0.0;
  double duration_s    = 0.0;

  // WKT LINESTRING, lon/lat order
  std::string geometry_wkt;
  std::string road_type;
  std::string road_name;
};

} // namespace roadcast::db::model
