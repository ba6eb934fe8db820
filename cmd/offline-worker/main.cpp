#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/core/interception_worker.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using offline::factory::Build;
using offline::runtime::Server;

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
    std::cerr << "Usage: offline-worker <config.yaml> OR offline-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = offline::config::ConfigLoader::LoadFromYaml(config_path);

    offline::observability::InitializeTracing(config);
    offline::observability::InitializeMetrics(config);
    offline::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // initial install; until one succeeds every request passes through
    try {
      app.worker->Install(config.cache().version());
    } catch (const offline::util::InstallFailed& e) {
      OFFLINE_LOG_WARN("Initial install failed; retry with Install", {offline::observability::StringField("error", e.what())});
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    OFFLINE_LOG_INFO("Offline worker started", {offline::observability::StringField("bind_address", config.server().bind_address()),
                                                offline::observability::StringField("upstream", config.upstream().origin())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    OFFLINE_LOG_INFO("Shutting down offline worker");

    server.Stop();
    app.StopWorkers();
    offline::observability::ShutdownLogging();
    offline::observability::ShutdownMetrics();
    offline::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    OFFLINE_LOG_ERROR("Fatal error", {offline::observability::StringField("error", e.what())});
    offline::observability::ShutdownLogging();
    offline::observability::ShutdownMetrics();
    offline::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
