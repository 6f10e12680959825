#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/queue_repository.hpp"
#include "sensor_agent.hpp"

namespace sensorlink::sensor {

std::shared_ptr<db::QueueRepository> BuildQueueRepository(const sensorlink::runtime::config::SensorConfig::Queue& queue);

DispatcherOptions BuildDispatcherOptions(const sensorlink::runtime::config::SensorConfig& config);

/*
  Composition root of the sensor process: durable queue, gRPC transports,
  dispatcher, control channel and optional spool intake.
*/
std::unique_ptr<SensorAgent> BuildAgent(const sensorlink::runtime::config::SensorConfig& config);

} // namespace sensorlink::sensor
