#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "oncall/services/v1/schedule_service.grpc.pb.h"
#include "internal/service/schedule_service.hpp"

namespace oncall::grpc {

class ScheduleServer final : public oncall::services::v1::ScheduleService::Service {
public:
  explicit ScheduleServer(std::shared_ptr<oncall::service::ScheduleService> svc);

  ::grpc::Status RenderSchedule(::grpc::ServerContext*,
                                const oncall::services::v1::RenderScheduleRequest*,
                                oncall::services::v1::RenderScheduleResponse*) override;

private:
  std::shared_ptr<oncall::service::ScheduleService> service_;
};

}
