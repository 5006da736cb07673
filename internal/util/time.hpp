#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace roadcast::util {

/*
  Time utilities. All stored timestamps are UTC milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

} // namespace roadcast::util
