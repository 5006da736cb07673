#pragma once

#include <cstdint>
#include <string>

#include "internal/util/time.hpp"

namespace roadcast::cache {

struct CacheEntry {
  std::string     key;
  std::string     payload;
  util::TimePoint created_at;
  util::TimePoint expires_at;
  std::string     generation;

  bool IsExpired(util::TimePoint now) const {
    return expires_at <= now;
  }
};

// Expiry for entries that live until invalidated (routes). Must stay inside
// the range of a nanosecond system_clock (about year 2262).
inline constexpr std::int64_t kNoExpiryUnixMillis = 7258118400000; // 2200-01-01T00:00:00Z

inline util::TimePoint NoExpiry() {
  return util::FromUnixMillis(kNoExpiryUnixMillis);
}

} // namespace roadcast::cache
