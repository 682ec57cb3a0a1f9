#pragma once

#include "oncall/core/v1/schedule.pb.h"

#include "oncall/services/v1/schedule_service.pb.h"

namespace oncall::v1 {
using namespace ::oncall::core::v1;
using namespace ::oncall::services::v1;
}
