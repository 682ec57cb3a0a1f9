#include "sweep_engine.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "base_rotation.hpp"
#include "event_collector.hpp"
#include "internal/util/errors.hpp"
#include "segment_merger.hpp"

namespace oncall::render {

namespace {

std::vector<model::UserId> SeedStack(const std::vector<model::Override>& overrides, util::TimePoint from) {
  std::vector<const model::Override*> active;
  for (const auto& override_entry : overrides) {
    if (override_entry.start < from && override_entry.end > from) {
      active.push_back(&override_entry);
    }
  }

  // Oldest at the bottom so later starts take precedence.
  std::stable_sort(active.begin(), active.end(), [](const model::Override* a, const model::Override* b) { return a->start < b->start; });

  std::vector<model::UserId> stack;
  stack.reserve(active.size());
  for (const auto* override_entry : active) {
    stack.push_back(override_entry->user);
  }
  return stack;
}

const model::UserId& EffectiveUser(const std::vector<model::UserId>& stack, const model::Schedule& schedule, util::TimePoint at) {
  return stack.empty() ? ResolveBaseUser(schedule, at) : stack.back();
}

void Apply(const Event& event, std::vector<model::UserId>& stack) {
  switch (event.kind) {
    case EventKind::kOverrideStart:
      stack.push_back(event.user);
      break;
    case EventKind::kOverrideEnd:
      if (!stack.empty() && stack.back() == event.user) {
        stack.pop_back();
      }
      break;
    case EventKind::kHandover:
      // Only forces a boundary; the base user is re-resolved afterwards.
      break;
  }
}

} // namespace

std::vector<model::Segment> Render(const model::Schedule&              schedule,
                                   const std::vector<model::Override>& overrides,
                                   util::TimePoint                     from,
                                   util::TimePoint                     until) {
  if (from >= until) {
    return {};
  }
  if (schedule.users.empty()) {
    throw util::ValidationError("Schedule must contain at least one user");
  }
  if (schedule.rotation_interval <= util::Duration::zero()) {
    throw util::ValidationError("Rotation interval must be positive");
  }

  auto events = CollectEvents(schedule, overrides, from, until);
  std::stable_sort(events.begin(), events.end());

  auto stack = SeedStack(overrides, from);

  std::vector<model::Segment> segments;
  segments.reserve(events.size() + 1);

  util::TimePoint current_time = from;
  model::UserId   current_user = EffectiveUser(stack, schedule, current_time);

  for (const auto& event : events) {
    if (current_time < event.time) {
      segments.push_back({current_user, current_time, event.time});
    }

    Apply(event, stack);

    current_time = event.time;
    current_user = EffectiveUser(stack, schedule, current_time);
  }

  if (current_time < until) {
    segments.push_back({current_user, current_time, until});
  }

  return MergeSegments(std::move(segments));
}

} // namespace oncall::render
