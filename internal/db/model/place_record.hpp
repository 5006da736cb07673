#pragma once

#include <cstdint>
#include <string>

namespace roadcast::db::model {

struct PlaceRecord {
  std::int64_t id = 0;

  // natural key
  std::string name;
  std::string place_type;
  std::string region;

  double      lat = 0.0;
  double      lon = 0.0;
  std::string time_zone;
  std::string metadata_json;

  std::int64_t created_at_ms = 0;
};

} // namespace roadcast::db::model
