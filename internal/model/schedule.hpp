#pragma once

#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace oncall::model {

using UserId = std::string;

/*
  Rotation definition. users[0] is on duty for the period starting at
  rotation_anchor; each later period hands over to the next user, wrapping
  around. Instants before the anchor project backward through the cycle.
*/
struct Schedule {
  std::vector<UserId> users;
  util::TimePoint     rotation_anchor{};
  util::Duration      rotation_interval{};
};

// Preempts the rotation (and any enclosing override) over [start, end).
struct Override {
  UserId          user;
  util::TimePoint start{};
  util::TimePoint end{};
};

struct Segment {
  UserId          user;
  util::TimePoint start{};
  util::TimePoint end{};

  bool operator==(const Segment& other) const {
    return user == other.user && start == other.start && end == other.end;
  }
};

} // namespace oncall::model
