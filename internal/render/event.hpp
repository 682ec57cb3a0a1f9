#pragma once

#include <cstdint>
#include <tuple>

#include "internal/model/schedule.hpp"
#include "internal/util/time.hpp"

namespace oncall::render {

/*
  Kinds of timeline boundaries. The ordinal is the tie-break at equal
  instants: an ending override is closed before anything opens, and
  handovers come last.
*/
enum class EventKind : std::uint8_t {
  kOverrideEnd   = 0,
  kOverrideStart = 1,
  kHandover      = 2,
};

struct Event {
  util::TimePoint time{};
  EventKind       kind = EventKind::kHandover;
  model::UserId   user; // empty for handovers

  bool operator<(const Event& other) const {
    return std::make_tuple(time, static_cast<std::uint8_t>(kind)) <
           std::make_tuple(other.time, static_cast<std::uint8_t>(other.kind));
  }
};

} // namespace oncall::render
