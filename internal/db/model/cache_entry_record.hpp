#pragma once

#include <cstdint>
#include <string>

namespace roadcast::db::model {

struct CacheEntryRecord {
  std::string  key;
  std::string  payload;
  std::int64_t created_at_ms = 0;
  std::int64_t expires_at_ms = 0;
  std::string  generation;
};

struct GraphCounts {
  std::uint64_t places        = 0;
  std::uint64_t nodes         = 0;
  std::uint64_t access_points = 0;
  std::uint64_t edges         = 0;
};

} // namespace roadcast::db::model
