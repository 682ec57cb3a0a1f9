#include "schedule_service.hpp"

#include <chrono>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "oncall/v1.hpp"

namespace oncall::service {

using namespace oncall::v1;

RenderScheduleResponse ScheduleService::RenderSchedule(const RenderScheduleRequest& req) const {
  const auto started_at = std::chrono::steady_clock::now();

  try {
    if (!req.has_schedule()) {
      throw util::ValidationError("Missing required field in input: 'schedule'");
    }
    if (!req.has_from() || !req.has_until()) {
      throw util::ValidationError("Missing required field in input: 'from' and 'until' are required");
    }

    const std::vector<Override> overrides(req.overrides().begin(), req.overrides().end());
    const auto segments = renderer_.Render(req.schedule(), overrides, util::FromProto(req.from()), util::FromProto(req.until()));

    RenderScheduleResponse resp;
    for (const auto& segment : segments) {
      *resp.add_segments() = segment;
    }

    ONCALL_LOG_DEBUG("Rendered schedule",
                     {observability::StringField("route", "ScheduleService.RenderSchedule"),
                      observability::IntField("overrides", req.overrides_size()),
                      observability::IntField("segments", resp.segments_size()),
                      observability::StringField(
                          "latency_ms", std::to_string(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count()))});
    return resp;
  } catch (const std::exception& ex) {
    ONCALL_LOG_WARN("RPC failed",
                    {observability::StringField("route", "ScheduleService.RenderSchedule"), observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace oncall::service
