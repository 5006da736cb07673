#include "temporal_key.hpp"

#include <absl/time/civil_time.h>

#include "internal/util/errors.hpp"

namespace roadcast::cache {

absl::TimeZone TemporalCacheKey::LoadZone(const std::string& name) {
  absl::TimeZone zone;
  if (name.empty() || !absl::LoadTimeZone(name, &zone)) {
    throw util::Invalid("unknown time zone: " + name);
  }
  return zone;
}

HourSlot TemporalCacheKey::SlotOf(util::TimePoint ts, const absl::TimeZone& zone) {
  const absl::CivilHour hour = absl::ToCivilHour(absl::FromChrono(ts), zone);

  HourSlot slot;
  slot.start = absl::ToChronoTime(absl::FromCivil(hour, zone));
  slot.end   = absl::ToChronoTime(absl::FromCivil(hour + 1, zone));
  return slot;
}

std::string TemporalCacheKey::Build(spatial::CellId cell, util::TimePoint forecast, const std::string& generation, const absl::TimeZone& zone) {
  const auto slot = SlotOf(forecast, zone);
  return "wx:" + spatial::SpatialCellIndex::ToString(cell) + ":" +
         absl::FormatTime("%Y%m%d%H%M", absl::FromChrono(slot.start), absl::UTCTimeZone()) + ":" + generation;
}

util::TimePoint TemporalCacheKey::ExpiresAt(util::TimePoint forecast, const absl::TimeZone& zone) {
  return SlotOf(forecast, zone).end;
}

std::chrono::milliseconds TemporalCacheKey::Ttl(util::TimePoint forecast, const absl::TimeZone& zone, util::TimePoint now) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ExpiresAt(forecast, zone) - now);
}

bool TemporalCacheKey::IsPastHour(util::TimePoint forecast, const absl::TimeZone& zone, util::TimePoint now) {
  return SlotOf(forecast, zone).end <= now;
}

} // namespace roadcast::cache
