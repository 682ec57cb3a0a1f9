#include "internal/render/schedule_renderer.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "oncall/v1.hpp"

namespace {

using oncall::render::ScheduleRenderer;
using oncall::util::FormatTimestamp;
using oncall::util::FromProto;
using oncall::util::ParseTimestamp;
using oncall::util::ToProto;
using oncall::v1::Override;
using oncall::v1::Schedule;
using oncall::v1::Segment;

Schedule WeeklySchedule() {
  Schedule schedule;
  schedule.add_users("alice");
  schedule.add_users("bob");
  schedule.add_users("charlie");
  *schedule.mutable_handover_start_at() = ToProto(ParseTimestamp("2025-11-07T17:00:00Z"));
  schedule.set_handover_interval_days(7);
  return schedule;
}

Override MakeOverride(const std::string& user, const char* start, const char* end) {
  Override override_entry;
  override_entry.set_user(user);
  *override_entry.mutable_start_at() = ToProto(ParseTimestamp(start));
  *override_entry.mutable_end_at()   = ToProto(ParseTimestamp(end));
  return override_entry;
}

bool IsSegment(const Segment& segment, const std::string& user, const char* start, const char* end) {
  return segment.user() == user && FormatTimestamp(FromProto(segment.start_at())) == start &&
         FormatTimestamp(FromProto(segment.end_at())) == end;
}

template <typename Fn>
bool ThrowsValidationError(Fn&& fn) {
  try {
    fn();
  } catch (const oncall::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestRendersWireMessages() {
  ScheduleRenderer renderer;

  const auto segments = renderer.Render(WeeklySchedule(), {MakeOverride("charlie", "2025-11-10T17:00:00Z", "2025-11-10T22:00:00Z")},
                                        ParseTimestamp("2025-11-07T17:00:00Z"), ParseTimestamp("2025-11-21T17:00:00Z"));

  assert(segments.size() == 4);
  assert(IsSegment(segments[0], "alice", "2025-11-07T17:00:00Z", "2025-11-10T17:00:00Z"));
  assert(IsSegment(segments[1], "charlie", "2025-11-10T17:00:00Z", "2025-11-10T22:00:00Z"));
  assert(IsSegment(segments[2], "alice", "2025-11-10T22:00:00Z", "2025-11-14T17:00:00Z"));
  assert(IsSegment(segments[3], "bob", "2025-11-14T17:00:00Z", "2025-11-21T17:00:00Z"));
}

void TestEmptyWindowIsRejected() {
  ScheduleRenderer renderer;
  const auto       at = ParseTimestamp("2025-11-07T17:00:00Z");

  assert(ThrowsValidationError([&] { (void)renderer.Render(WeeklySchedule(), {}, at, at); }));
  assert(ThrowsValidationError([&] { (void)renderer.Render(WeeklySchedule(), {}, at + std::chrono::hours(1), at); }));
}

void TestScheduleValidation() {
  ScheduleRenderer renderer;
  const auto       from  = ParseTimestamp("2025-11-07T17:00:00Z");
  const auto       until = ParseTimestamp("2025-11-14T17:00:00Z");

  auto no_users = WeeklySchedule();
  no_users.clear_users();
  assert(ThrowsValidationError([&] { (void)renderer.Render(no_users, {}, from, until); }));
  // Empty users fail even when the window is empty.
  assert(ThrowsValidationError([&] { (void)renderer.Render(no_users, {}, from, from); }));

  auto no_anchor = WeeklySchedule();
  no_anchor.clear_handover_start_at();
  assert(ThrowsValidationError([&] { (void)renderer.Render(no_anchor, {}, from, until); }));

  auto zero_interval = WeeklySchedule();
  zero_interval.set_handover_interval_days(0);
  assert(ThrowsValidationError([&] { (void)renderer.Render(zero_interval, {}, from, until); }));

  auto negative_interval = WeeklySchedule();
  negative_interval.set_handover_interval_days(-7);
  assert(ThrowsValidationError([&] { (void)renderer.Render(negative_interval, {}, from, until); }));
}

void TestOverrideValidation() {
  ScheduleRenderer renderer;
  const auto       from  = ParseTimestamp("2025-11-07T17:00:00Z");
  const auto       until = ParseTimestamp("2025-11-14T17:00:00Z");

  const auto zero_length = MakeOverride("bob", "2025-11-10T17:00:00Z", "2025-11-10T17:00:00Z");
  assert(ThrowsValidationError([&] { (void)renderer.Render(WeeklySchedule(), {zero_length}, from, until); }));

  const auto inverted = MakeOverride("bob", "2025-11-11T17:00:00Z", "2025-11-10T17:00:00Z");
  assert(ThrowsValidationError([&] { (void)renderer.Render(WeeklySchedule(), {inverted}, from, until); }));

  auto missing_end = MakeOverride("bob", "2025-11-10T17:00:00Z", "2025-11-11T17:00:00Z");
  missing_end.clear_end_at();
  assert(ThrowsValidationError([&] { (void)renderer.Render(WeeklySchedule(), {missing_end}, from, until); }));

  auto missing_user = MakeOverride("", "2025-11-10T17:00:00Z", "2025-11-11T17:00:00Z");
  assert(ThrowsValidationError([&] { (void)renderer.Render(WeeklySchedule(), {missing_user}, from, until); }));
}

void TestMultiDayIntervalConversion() {
  auto schedule = WeeklySchedule();
  schedule.set_handover_interval_days(1);

  const auto model = ScheduleRenderer::ToModel(schedule);
  assert(model.rotation_interval == std::chrono::hours(24));
  assert(model.users.size() == 3);
  assert(model.rotation_anchor == ParseTimestamp("2025-11-07T17:00:00Z"));
}

void TestAnchorCenturiesBeforeWindow() {
  ScheduleRenderer renderer;

  auto schedule                         = WeeklySchedule();
  *schedule.mutable_handover_start_at() = ToProto(ParseTimestamp("1600-01-01T00:00:00Z"));

  const auto segments =
      renderer.Render(schedule, {}, ParseTimestamp("2025-11-07T17:00:00Z"), ParseTimestamp("2025-11-21T17:00:00Z"));

  assert(segments.size() == 3);
  assert(IsSegment(segments[0], "bob", "2025-11-07T17:00:00Z", "2025-11-08T00:00:00Z"));
  assert(IsSegment(segments[1], "charlie", "2025-11-08T00:00:00Z", "2025-11-15T00:00:00Z"));
  assert(IsSegment(segments[2], "alice", "2025-11-15T00:00:00Z", "2025-11-21T17:00:00Z"));
}

void TestLargestIntervalRenders() {
  ScheduleRenderer renderer;

  auto schedule = WeeklySchedule();
  schedule.set_handover_interval_days(std::numeric_limits<std::int32_t>::max());

  const auto model = ScheduleRenderer::ToModel(schedule);
  assert(model.rotation_interval > oncall::util::Duration::zero());
  assert(model.rotation_interval == std::chrono::hours(24) * std::int64_t{std::numeric_limits<std::int32_t>::max()});

  const auto after = renderer.Render(schedule, {}, ParseTimestamp("2025-11-07T17:00:00Z"), ParseTimestamp("2025-11-21T17:00:00Z"));
  assert(after.size() == 1);
  assert(IsSegment(after[0], "alice", "2025-11-07T17:00:00Z", "2025-11-21T17:00:00Z"));

  // The period before the anchor belongs to the last user.
  const auto before = renderer.Render(schedule, {}, ParseTimestamp("2025-11-01T00:00:00Z"), ParseTimestamp("2025-11-09T00:00:00Z"));
  assert(before.size() == 2);
  assert(IsSegment(before[0], "charlie", "2025-11-01T00:00:00Z", "2025-11-07T17:00:00Z"));
  assert(IsSegment(before[1], "alice", "2025-11-07T17:00:00Z", "2025-11-09T00:00:00Z"));
}

void TestSubSecondWireTimestampIsRejected() {
  ScheduleRenderer renderer;

  auto schedule = WeeklySchedule();
  schedule.mutable_handover_start_at()->set_nanos(500000000);

  bool threw = false;
  try {
    (void)renderer.Render(schedule, {}, ParseTimestamp("2025-11-07T17:00:00Z"), ParseTimestamp("2025-11-21T17:00:00Z"));
  } catch (const oncall::util::MalformedInput&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRendersWireMessages();
  TestEmptyWindowIsRejected();
  TestScheduleValidation();
  TestOverrideValidation();
  TestMultiDayIntervalConversion();
  TestAnchorCenturiesBeforeWindow();
  TestLargestIntervalRenders();
  TestSubSecondWireTimestampIsRejected();

  std::cout << "oncall_unit_schedule_renderer: pass\n";
  return 0;
}
