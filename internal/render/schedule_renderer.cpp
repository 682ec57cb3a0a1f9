#include "schedule_renderer.hpp"

#include <string>

#include "internal/render/sweep_engine.hpp"
#include "internal/util/errors.hpp"

namespace oncall::render {

using namespace oncall::core::v1;

model::Schedule ScheduleRenderer::ToModel(const Schedule& schedule) {
  if (schedule.users().empty()) {
    throw util::ValidationError("Schedule must contain at least one user");
  }
  if (!schedule.has_handover_start_at()) {
    throw util::ValidationError("Missing required field in input: 'handover_start_at'");
  }
  if (schedule.handover_interval_days() <= 0) {
    throw util::ValidationError("'handover_interval_days' must be a positive number of days");
  }

  model::Schedule out;
  out.users.assign(schedule.users().begin(), schedule.users().end());
  out.rotation_anchor   = util::FromProto(schedule.handover_start_at());
  out.rotation_interval = util::Days(schedule.handover_interval_days());
  return out;
}

model::Override ScheduleRenderer::ToModel(const Override& override_entry) {
  if (override_entry.user().empty()) {
    throw util::ValidationError("Missing required field in input: 'user'");
  }
  if (!override_entry.has_start_at()) {
    throw util::ValidationError("Missing required field in input: 'start_at'");
  }
  if (!override_entry.has_end_at()) {
    throw util::ValidationError("Missing required field in input: 'end_at'");
  }

  model::Override out;
  out.user  = override_entry.user();
  out.start = util::FromProto(override_entry.start_at());
  out.end   = util::FromProto(override_entry.end_at());

  if (out.start >= out.end) {
    throw util::ValidationError("Override for '" + out.user + "' must start before it ends (" + util::FormatTimestamp(out.start) + " >= " +
                                util::FormatTimestamp(out.end) + ")");
  }
  return out;
}

Segment ScheduleRenderer::ToProto(const model::Segment& segment) {
  Segment out;
  out.set_user(segment.user);
  *out.mutable_start_at() = util::ToProto(segment.start);
  *out.mutable_end_at()   = util::ToProto(segment.end);
  return out;
}

std::vector<Segment> ScheduleRenderer::Render(const Schedule&              schedule,
                                              const std::vector<Override>& overrides,
                                              util::TimePoint              from,
                                              util::TimePoint              until) const {
  auto model_schedule = ToModel(schedule);

  if (from >= until) {
    throw util::ValidationError("'from' time must be before 'until' time");
  }

  std::vector<model::Override> model_overrides;
  model_overrides.reserve(overrides.size());
  for (const auto& override_entry : overrides) {
    model_overrides.push_back(ToModel(override_entry));
  }

  const auto segments = render::Render(model_schedule, model_overrides, from, until);

  std::vector<Segment> out;
  out.reserve(segments.size());
  for (const auto& segment : segments) {
    out.push_back(ToProto(segment));
  }
  return out;
}

} // namespace oncall::render
