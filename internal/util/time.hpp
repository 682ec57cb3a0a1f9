#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace oncall::util {

/*
  Time utilities. Every instant is an absolute point on the UTC timeline,
  held at whole-second resolution so that the full Timestamp range
  (0001-01-01 .. 9999-12-31) and any difference between two such instants
  fit in the representation.
*/

using Clock     = std::chrono::system_clock;
using Duration  = std::chrono::seconds;
using TimePoint = std::chrono::time_point<Clock, Duration>;
using Days      = std::chrono::duration<std::int64_t, std::ratio<86400>>;

// Accepts RFC 3339 timestamps ("2025-11-07T17:00:00Z", "...+02:00").
// Throws MalformedInput, including for sub-second values.
TimePoint ParseTimestamp(std::string_view text);

// UTC with a "Z" suffix.
std::string FormatTimestamp(TimePoint tp);

google::protobuf::Timestamp ToProto(TimePoint tp);

// Throws MalformedInput when the Timestamp is outside 0001-01-01 .. 9999-12-31
// or carries non-zero nanos.
TimePoint FromProto(const google::protobuf::Timestamp& ts);

} // namespace oncall::util
