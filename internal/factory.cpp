#include "factory.hpp"

#include "internal/grpc/schedule_server.hpp"

namespace oncall::factory {

Application Build(const oncall::runtime::config::RuntimeConfig&) {
  Application app;
  app.schedule_service = std::make_shared<service::ScheduleService>();
  app.grpc_services.push_back(std::make_unique<grpc::ScheduleServer>(app.schedule_service));
  return app;
}

} // namespace oncall::factory
