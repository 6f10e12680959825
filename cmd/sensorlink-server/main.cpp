#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/control/session_registry.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/snapshot/snapshot_cache.hpp"

using sensorlink::runtime::Server;

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
    std::cerr << "Usage: sensorlink-server <config.yaml> OR sensorlink-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sensorlink::config::ConfigLoader::LoadServerConfig(config_path);

    sensorlink::observability::InitializeTracing(config.observability(), "sensorlink-server");
    sensorlink::observability::InitializeMetrics(config.observability(), "sensorlink-server");
    sensorlink::observability::InitializeLogging(config.logging(), "sensorlink-server");

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = sensorlink::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address().empty() ? "0.0.0.0:7443" : config.server().bind_address();
    Server            server(bind_address, std::move(app.grpc_services), app.server_options);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SENSORLINK_LOG_INFO("Collector started", {sensorlink::observability::StringField("bind_address", bind_address),
                                              sensorlink::observability::IntField("port", server.Port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SENSORLINK_LOG_INFO("Shutting down collector");

    for (auto& worker : app.background_workers) worker->Stop();
    app.ctx.sessions->CloseAll();
    app.ctx.snapshots->Feed().CloseAll();
    server.Stop();

    sensorlink::observability::ShutdownLogging();
    sensorlink::observability::ShutdownMetrics();
    sensorlink::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SENSORLINK_LOG_ERROR("Fatal error", {sensorlink::observability::StringField("error", e.what())});
    sensorlink::observability::ShutdownLogging();
    sensorlink::observability::ShutdownMetrics();
    sensorlink::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
