#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/service/schedule_service.hpp"

namespace oncall::factory {

/*
  Application

  Owns the long-lived services used by the server.
*/
struct Application {
  std::shared_ptr<service::ScheduleService> schedule_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root of the server: the only place that wires services to
  their transport adapters.
*/
Application Build(const oncall::runtime::config::RuntimeConfig& config);

} // namespace oncall::factory
