#include "event_collector.hpp"

#include "base_rotation.hpp"

namespace oncall::render {

std::vector<Event> CollectOverrideEvents(const std::vector<model::Override>& overrides, util::TimePoint from, util::TimePoint until) {
  std::vector<Event> events;

  for (const auto& override_entry : overrides) {
    // Degenerate spans would leave a start on the stack with no matching end.
    if (override_entry.start >= override_entry.end) {
      continue;
    }
    if (override_entry.end <= from || override_entry.start >= until) {
      continue;
    }

    if (override_entry.start >= from) {
      events.push_back({override_entry.start, EventKind::kOverrideStart, override_entry.user});
    }
    if (override_entry.end <= until) {
      events.push_back({override_entry.end, EventKind::kOverrideEnd, override_entry.user});
    }
  }

  return events;
}

std::vector<Event> CollectHandoverEvents(const model::Schedule& schedule, util::TimePoint from, util::TimePoint until) {
  std::vector<Event> events;
  if (schedule.users.empty() || schedule.rotation_interval <= util::Duration::zero()) {
    return events;
  }

  for (auto boundary = ShiftStart(schedule, from); boundary < until; boundary += schedule.rotation_interval) {
    if (boundary >= from) {
      events.push_back({boundary, EventKind::kHandover, {}});
    }
  }

  return events;
}

std::vector<Event> CollectEvents(const model::Schedule&              schedule,
                                 const std::vector<model::Override>& overrides,
                                 util::TimePoint                     from,
                                 util::TimePoint                     until) {
  auto events    = CollectOverrideEvents(overrides, from, until);
  auto handovers = CollectHandoverEvents(schedule, from, until);
  events.insert(events.end(), handovers.begin(), handovers.end());
  return events;
}

} // namespace oncall::render
