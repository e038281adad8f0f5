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

using impact::factory::Build;
using impact::runtime::Server;

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
    std::cerr << "Usage: impact-engine <config.yaml> OR impact-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = impact::config::ConfigLoader::LoadFromYaml(config_path);

    impact::observability::InitializeTracing(config);
    impact::observability::InitializeMetrics(config);
    impact::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    IMPACT_LOG_INFO("Impact engine started", {impact::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    IMPACT_LOG_INFO("Shutting down impact engine");

    server.Stop();
    impact::observability::ShutdownLogging();
    impact::observability::ShutdownMetrics();
    impact::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    IMPACT_LOG_ERROR("Fatal error", {impact::observability::StringField("error", e.what())});
    impact::observability::ShutdownLogging();
    impact::observability::ShutdownMetrics();
    impact::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
