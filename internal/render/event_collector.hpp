#pragma once

#include <vector>

#include "event.hpp"
#include "internal/model/schedule.hpp"

namespace oncall::render {

/*
  Collects the boundary events needed to rebuild the timeline inside
  [from, until). Results are unsorted.

  Overrides already active at `from` produce no start event (they seed the
  sweep stack instead); overrides still active at `until` produce no end
  event (the final segment truncates them).
*/
std::vector<Event> CollectOverrideEvents(const std::vector<model::Override>& overrides,
                                         util::TimePoint                     from,
                                         util::TimePoint                     until);

std::vector<Event> CollectHandoverEvents(const model::Schedule& schedule, util::TimePoint from, util::TimePoint until);

std::vector<Event> CollectEvents(const model::Schedule&              schedule,
                                 const std::vector<model::Override>& overrides,
                                 util::TimePoint                     from,
                                 util::TimePoint                     until);

} // namespace oncall::render
