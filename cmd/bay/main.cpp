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

using bay::factory::Build;
using bay::runtime::Server;

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
    std::cerr << "Usage: bay [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    const auto resolved = bay::config::ConfigLoader::ResolvePath(config_path);
    auto config = resolved.empty() ? bay::config::ConfigLoader::Defaults() : bay::config::ConfigLoader::LoadFromYaml(resolved);

    bay::observability::InitializeTracing(config);
    bay::observability::InitializeMetrics(config);
    bay::observability::InitializeLogging(config);
    BAY_LOG_INFO("configuration loaded", {bay::observability::StringField("path", resolved.empty() ? "<defaults>" : resolved)});

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Catch up on anything left behind while the process was down.
    if (app.gc_run_on_startup) {
      app.gc->RunOnce();
    }
    app.gc->Start();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    BAY_LOG_INFO("bay started", {bay::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BAY_LOG_INFO("Shutting down bay");

    server.Stop();
    app.gc->Stop();
    bay::observability::ShutdownLogging();
    bay::observability::ShutdownMetrics();
    bay::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    BAY_LOG_ERROR("Fatal error", {bay::observability::StringField("error", e.what())});
    bay::observability::ShutdownLogging();
    bay::observability::ShutdownMetrics();
    bay::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
