#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using oncall::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: oncall-server <config.yaml> OR oncall-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = oncall::config::ConfigLoader::LoadFromYaml(config_path);

    oncall::observability::InitializeLogging(config);

    if (config.server().bind_address().empty()) {
      throw std::runtime_error("Invalid configuration: server.bind_address is required");
    }

    // ------------------------------------------------------------
    // Build application
    // ------------------------------------------------------------
    auto app = oncall::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ONCALL_LOG_INFO("On-call scheduler started", {oncall::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ONCALL_LOG_INFO("Shutting down on-call scheduler");

    server.Stop();
    oncall::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    oncall::observability::ShutdownLogging();
    return 1;
  }

  return 0;
}
