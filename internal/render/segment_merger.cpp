#include "segment_merger.hpp"

#include <utility>

namespace oncall::render {

std::vector<model::Segment> MergeSegments(std::vector<model::Segment> segments) {
  std::vector<model::Segment> merged;
  merged.reserve(segments.size());

  for (auto& segment : segments) {
    if (!merged.empty()) {
      auto& last = merged.back();
      if (last.user == segment.user && last.end == segment.start) {
        last.end = segment.end;
        continue;
      }
    }
    merged.push_back(std::move(segment));
  }

  return merged;
}

} // namespace oncall::render
