#include "schedule_server.hpp"

#include "grpc_error.hpp"
#include "oncall/v1.hpp"

namespace oncall::grpc {

ScheduleServer::ScheduleServer(std::shared_ptr<oncall::service::ScheduleService> svc) : service_(std::move(svc)) {
}

::grpc::Status ScheduleServer::RenderSchedule(::grpc::ServerContext*,
                                              const oncall::services::v1::RenderScheduleRequest* req,
                                              oncall::services::v1::RenderScheduleResponse*      resp) {
  try {
    *resp = service_->RenderSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace oncall::grpc
