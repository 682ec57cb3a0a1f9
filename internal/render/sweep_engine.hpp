#pragma once

#include <vector>

#include "internal/model/schedule.hpp"

namespace oncall::render {

/*
  Event sweep over rotation and override boundaries.

  Returns merged segments whose union is exactly [from, until). An empty
  window (from >= until) yields an empty list. Throws util::ValidationError
  when the schedule has no users.

  Active overrides form a stack: the most recently started one wins, and an
  end event pops only when it matches the top. Overrides that overlap without
  nesting therefore leave the earlier override on the stack until its own
  end is reached at the top.
*/
std::vector<model::Segment> Render(const model::Schedule&              schedule,
                                   const std::vector<model::Override>& overrides,
                                   util::TimePoint                     from,
                                   util::TimePoint                     until);

} // namespace oncall::render
