#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <string>

#include "internal/util/errors.hpp"

namespace oncall::util {

using google::protobuf::util::TimeUtil;

TimePoint ParseTimestamp(std::string_view text) {
  google::protobuf::Timestamp ts;
  if (!TimeUtil::FromString(std::string(text), &ts)) {
    throw MalformedInput("Invalid timestamp: '" + std::string(text) + "'");
  }
  return FromProto(ts);
}

std::string FormatTimestamp(TimePoint tp) {
  return TimeUtil::ToString(ToProto(tp));
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(tp.time_since_epoch().count());
  ts.set_nanos(0);
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() < TimeUtil::kTimestampMinSeconds || ts.seconds() > TimeUtil::kTimestampMaxSeconds) {
    throw MalformedInput("Timestamp out of range: " + std::to_string(ts.seconds()) + "s");
  }
  if (ts.nanos() != 0) {
    throw MalformedInput("Sub-second timestamps are not supported: " + TimeUtil::ToString(ts));
  }
  return TimePoint{Duration{ts.seconds()}};
}

} // namespace oncall::util
