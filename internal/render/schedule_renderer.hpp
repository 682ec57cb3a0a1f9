#pragma once

#include <vector>

#include "internal/model/schedule.hpp"
#include "internal/util/time.hpp"
#include "oncall/core/v1/schedule.pb.h"

namespace oncall::render {

/*
  Validated entry point over the wire messages.

  Owns the business checks the engine leaves out: a non-empty user list, a
  positive interval, complete overrides with start_at < end_at, and a
  non-empty query window. Any violation throws util::ValidationError before
  rendering starts.
*/
class ScheduleRenderer {
 public:
  static model::Schedule ToModel(const oncall::core::v1::Schedule& schedule);
  static model::Override ToModel(const oncall::core::v1::Override& override_entry);

  static oncall::core::v1::Segment ToProto(const model::Segment& segment);

  std::vector<oncall::core::v1::Segment> Render(const oncall::core::v1::Schedule&               schedule,
                                                const std::vector<oncall::core::v1::Override>& overrides,
                                                util::TimePoint                                 from,
                                                util::TimePoint                                 until) const;
};

} // namespace oncall::render
