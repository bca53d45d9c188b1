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

using proxicloud::factory::Build;
using proxicloud::runtime::Server;

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
    std::cerr << "Usage: proxicloud-projects <config.yaml> OR proxicloud-projects --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = proxicloud::config::ConfigLoader::LoadFromYaml(config_path);

    proxicloud::observability::InitializeTracing(config);
    proxicloud::observability::InitializeMetrics(config);
    proxicloud::observability::InitializeLogging(config);

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
    PROXICLOUD_LOG_INFO("Project service started", {proxicloud::observability::StringField("bind_address", config.server().bind_address()),
                                                    proxicloud::observability::StringField("store", config.store().path())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PROXICLOUD_LOG_INFO("Shutting down project service");

    server.Stop();
    proxicloud::observability::ShutdownLogging();
    proxicloud::observability::ShutdownMetrics();
    proxicloud::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PROXICLOUD_LOG_ERROR("Fatal error", {proxicloud::observability::StringField("error", e.what())});
    proxicloud::observability::ShutdownLogging();
    proxicloud::observability::ShutdownMetrics();
    proxicloud::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
