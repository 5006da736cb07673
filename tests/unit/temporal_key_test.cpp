#include "internal/cache/temporal_key.hpp"

#include <absl/time/civil_time.h>

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using roadcast::cache::TemporalCacheKey;
using roadcast::util::TimePoint;

TimePoint Local(const absl::TimeZone& zone, int hour, int minute) {
  return absl::ToChronoTime(absl::FromCivil(absl::CivilMinute(2025, 6, 1, hour, minute), zone));
}

void TestExpiryIsTopOfNextLocalHour() {
  const auto zone     = TemporalCacheKey::LoadZone("Asia/Tehran");
  const auto forecast = Local(zone, 14, 30);
  const auto now      = Local(zone, 13, 45);

  assert(TemporalCacheKey::ExpiresAt(forecast, zone) == Local(zone, 15, 0));
  assert(TemporalCacheKey::Ttl(forecast, zone, now) == std::chrono::minutes(75));
  assert(!TemporalCacheKey::IsPastHour(forecast, zone, now));
}

void TestHalfHourOffsetZoneUsesLocalHours() {
  // Tehran is UTC+03:30: local 14:00 is 10:30 UTC, not a UTC hour boundary.
  const auto zone = TemporalCacheKey::LoadZone("Asia/Tehran");
  const auto slot = TemporalCacheKey::SlotOf(Local(zone, 14, 10), zone);
  assert(slot.start == Local(zone, 14, 0));
  assert(slot.end == Local(zone, 15, 0));

  const auto utc_start = absl::ToCivilMinute(absl::FromChrono(slot.start), absl::UTCTimeZone());
  assert(utc_start.minute() == 30);
}

void TestKeysShareTheHourSlot() {
  const auto zone = TemporalCacheKey::LoadZone("Asia/Kolkata");

  const auto a = TemporalCacheKey::Build(42, Local(zone, 9, 5), "g1", zone);
  const auto b = TemporalCacheKey::Build(42, Local(zone, 9, 55), "g1", zone);
  const auto c = TemporalCacheKey::Build(42, Local(zone, 10, 0), "g1", zone);
  const auto d = TemporalCacheKey::Build(42, Local(zone, 9, 5), "g2", zone);
  const auto e = TemporalCacheKey::Build(43, Local(zone, 9, 5), "g1", zone);

  assert(a == b);
  assert(a != c);
  assert(a != d);
  assert(a != e);
}

void TestPastHourHasNoTtl() {
  const auto zone     = TemporalCacheKey::LoadZone("Asia/Tehran");
  const auto forecast = Local(zone, 12, 30);
  const auto now      = Local(zone, 13, 45);

  assert(TemporalCacheKey::IsPastHour(forecast, zone, now));
  assert(TemporalCacheKey::Ttl(forecast, zone, now).count() <= 0);

  // Exactly at the boundary the hour is over.
  assert(TemporalCacheKey::IsPastHour(Local(zone, 13, 0), zone, Local(zone, 14, 0)));
}

void TestUnknownZoneIsInvalid() {
  bool threw = false;
  try {
    TemporalCacheKey::LoadZone("Mars/Olympus_Mons");
  } catch (const roadcast::util::Invalid&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestExpiryIsTopOfNextLocalHour();
  TestHalfHourOffsetZoneUsesLocalHours();
  TestKeysShareTheHourSlot();
  TestPastHourHasNoTtl();
  TestUnknownZoneIsInvalid();

  std::cout << "temporal_key_test: pass" << std::endl;
  return 0;
}
