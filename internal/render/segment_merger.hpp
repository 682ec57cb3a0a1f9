#pragma once

#include <vector>

#include "internal/model/schedule.hpp"

namespace oncall::render {

// Coalesces neighbours that share a user and touch in time. Order is kept.
std::vector<model::Segment> MergeSegments(std::vector<model::Segment> segments);

} // namespace oncall::render
