#pragma once

#include <cstdint>

#include "internal/model/schedule.hpp"
#include "internal/util/time.hpp"

namespace oncall::render {

/*
  Base rotation resolver.

  Pure functions of (anchor, interval, user count). Periods are counted with
  a true floor division so instants before the anchor fall into negative
  periods instead of being rounded toward zero.
*/

// Index of the rotation period containing `instant`; negative before the anchor.
std::int64_t PeriodIndex(const model::Schedule& schedule, util::TimePoint instant);

// Start of the rotation period containing `instant`.
util::TimePoint ShiftStart(const model::Schedule& schedule, util::TimePoint instant);

// User on base rotation duty at `instant`. Requires a non-empty user list.
const model::UserId& ResolveBaseUser(const model::Schedule& schedule, util::TimePoint instant);

} // namespace oncall::render
