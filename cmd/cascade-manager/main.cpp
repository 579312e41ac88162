#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/worker/cascade_worker.hpp"

using cascade::runtime::Server;

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
    std::cerr << "Usage: cascade-manager <config.yaml> OR cascade-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = cascade::config::ConfigLoader::LoadFromYaml(config_path);

    cascade::observability::InitializeTracing(config);
    cascade::observability::InitializeMetrics(config);
    cascade::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = cascade::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CASCADE_LOG_INFO("Cascade manager started", {cascade::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CASCADE_LOG_INFO("Shutting down cascade manager");

    server.Stop();
    app.worker->Stop();
    cascade::observability::ShutdownLogging();
    cascade::observability::ShutdownMetrics();
    cascade::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    CASCADE_LOG_ERROR("Fatal error", {cascade::observability::StringField("error", e.what())});
    cascade::observability::ShutdownLogging();
    cascade::observability::ShutdownMetrics();
    cascade::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
