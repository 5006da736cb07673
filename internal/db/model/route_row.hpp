#pragma once

#include <cstdint>
#include <string>

namespace roadcast::db::model {

struct RouteRow {
  std::int64_t id              = 0;
  std::int64_t source_place_id = 0;
  std::int64_t target_place_id = 0;

  std::string  payload_json;
  double       distance_km    = 0.0;
  double       duration_hours = 0.0;
  std::int64_t created_at_ms  = 0;
};

} // namespace roadcast::db::model
