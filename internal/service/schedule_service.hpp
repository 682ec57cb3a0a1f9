#pragma once

#include "internal/render/schedule_renderer.hpp"
#include "oncall/services/v1/schedule_service.pb.h"

namespace oncall::service {

class ScheduleService {
public:
  ScheduleService() = default;

  oncall::services::v1::RenderScheduleResponse
  RenderSchedule(const oncall::services::v1::RenderScheduleRequest& req) const;

private:
  render::ScheduleRenderer renderer_;
};

}
