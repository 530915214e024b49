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

using gate::factory::Build;
using gate::runtime::Server;

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
  } else if (argc != 1) {
    std::cerr << "Usage: submission-gate [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? gate::config::ConfigLoader::FromEnvironment()
                                      : gate::config::ConfigLoader::LoadFromYaml(config_path);

    gate::observability::InitializeTracing(config);
    gate::observability::InitializeMetrics(config);
    gate::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(app.server_options, app.http_handler);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    GATE_LOG_INFO("Submission gate started", {gate::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    GATE_LOG_INFO("Shutting down submission gate");

    server.Stop();
    gate::observability::ShutdownLogging();
    gate::observability::ShutdownMetrics();
    gate::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    GATE_LOG_ERROR("Fatal error", {gate::observability::StringField("error", e.what())});
    gate::observability::ShutdownLogging();
    gate::observability::ShutdownMetrics();
    gate::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
