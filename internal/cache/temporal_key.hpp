#pragma once

#include <absl/time/time.h>

#include <chrono>
#include <string>

#include "internal/spatial/cell_index.hpp"
#include "internal/util/time.hpp"

namespace roadcast::cache {

// One local clock hour [start, end) expressed in UTC instants.
struct HourSlot {
  util::TimePoint start;
  util::TimePoint end;
};

/*
  TemporalCacheKey

  Weather keys are (cell, local forecast hour, model generation). The entry
  written for a key expires at the top of the next local hour after the
  forecast time, so it can never be served across a forecast roll-over.

  Half-hour offset zones (Asia/Tehran, Asia/Kolkata) are why the hour slot is
  computed in local time and not by truncating UTC.
*/
class TemporalCacheKey {
 public:
  // Throws util::Invalid for an unknown IANA zone name.
  static absl::TimeZone LoadZone(const std::string& name);

  static HourSlot SlotOf(util::TimePoint ts, const absl::TimeZone& zone);

  static std::string Build(spatial::CellId cell, util::TimePoint forecast, const std::string& generation,
                           const absl::TimeZone& zone = absl::UTCTimeZone());

  static util::TimePoint ExpiresAt(util::TimePoint forecast, const absl::TimeZone& zone);

  // Time left until ExpiresAt(forecast); zero or negative when already past.
  static std::chrono::milliseconds Ttl(util::TimePoint forecast, const absl::TimeZone& zone, util::TimePoint now);

  static bool IsPastHour(util::TimePoint forecast, const absl::TimeZone& zone, util::TimePoint now);
};

} // namespace roadcast::cache
