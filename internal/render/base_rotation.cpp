#include "base_rotation.hpp"

namespace oncall::render {

namespace {

std::int64_t FloorDiv(std::int64_t numerator, std::int64_t denominator) {
  std::int64_t quotient = numerator / denominator;
  if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
    --quotient;
  }
  return quotient;
}

std::int64_t FloorMod(std::int64_t value, std::int64_t modulus) {
  const std::int64_t rem = value % modulus;
  return rem < 0 ? rem + modulus : rem;
}

} // namespace

std::int64_t PeriodIndex(const model::Schedule& schedule, util::TimePoint instant) {
  const util::Duration elapsed = instant - schedule.rotation_anchor;
  return FloorDiv(elapsed.count(), schedule.rotation_interval.count());
}

util::TimePoint ShiftStart(const model::Schedule& schedule, util::TimePoint instant) {
  return schedule.rotation_anchor + PeriodIndex(schedule, instant) * schedule.rotation_interval;
}

const model::UserId& ResolveBaseUser(const model::Schedule& schedule, util::TimePoint instant) {
  const auto user_count = static_cast<std::int64_t>(schedule.users.size());
  const auto user_index = FloorMod(PeriodIndex(schedule, instant), user_count);
  return schedule.users[static_cast<std::size_t>(user_index)];
}

} // namespace oncall::render
