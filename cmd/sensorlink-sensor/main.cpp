#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/sensor/sensor_factory.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Shutdown() {
  sensorlink::observability::ShutdownLogging();
  sensorlink::observability::ShutdownMetrics();
  sensorlink::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: sensorlink-sensor <config.yaml> OR sensorlink-sensor --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = sensorlink::config::ConfigLoader::LoadSensorConfig(config_path);

    sensorlink::observability::InitializeTracing(config.observability(), "sensorlink-sensor", config.sensor_id());
    sensorlink::observability::InitializeMetrics(config.observability(), "sensorlink-sensor", config.sensor_id());
    sensorlink::observability::InitializeLogging(config.logging(), "sensorlink-sensor");

    auto agent = sensorlink::sensor::BuildAgent(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    agent->Start();

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (agent->Control().State() == sensorlink::sensor::ChannelState::Unauthorized) {
        SENSORLINK_LOG_ERROR("Credential refused by the collector, stopping");
        agent->Stop();
        Shutdown();
        return 3;
      }
    }

    SENSORLINK_LOG_INFO("Shutting down sensor", {sensorlink::observability::UintField("queue_depth", agent->Queue().QueueDepth())});
    agent->Stop();
    Shutdown();
  } catch (const std::exception& e) {
    SENSORLINK_LOG_ERROR("Fatal error", {sensorlink::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
