#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace roadcast::db::model {

inline constexpr const char* kNodeTypeRoad        = "road";
inline constexpr const char* kNodeTypeAccessPoint = "access_point";

struct NodeRecord {
  std::int64_t id = 0;
  double       lat = 0.0;
  double       lon = 0.0;

  // Quantized coordinate, unique; identical concurrent inserts collapse on it.
  std::string coord_key;

  std::optional<std::int64_t> linked_place_id;
  std::string                 node_type = kNodeTypeRoad;
  std::string                 label;
};

} // namespace roadcast::db::model
