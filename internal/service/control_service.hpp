#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "sensorlink/pipeline/v1.hpp"
#include "service_context.hpp"

namespace sensorlink::control {
class ControlSession;
}

namespace sensorlink::service {

struct ControlOptions {
  std::chrono::milliseconds heartbeat_interval{10'000};
  std::chrono::milliseconds heartbeat_timeout{30'000};
};

// Credentials presented with the call, outside the message body.
struct CallCredentials {
  std::string bearer_token;
  std::string sensor_id;
};

/*
  Server end of the control channel.

  Transport adapters drive it: Authenticate the first message, Open the
  session, HandleMessage for each later message, Close on disconnect.
*/
class ControlService {
 public:
  explicit ControlService(ServiceContext ctx, ControlOptions options = {});

  // Validates a registration. Throws util::UnauthorizedSensor or util::InvalidArgument.
  void Authenticate(const sensorlink::pipeline::v1::Register& registration, const CallCredentials& credentials);

  // Registers the session (superseding any older one), replies RegisterAccepted
  // and asks for pending chunks.
  void Open(const std::shared_ptr<sensorlink::control::ControlSession>& session, const sensorlink::pipeline::v1::Register& registration);

  void HandleMessage(const std::shared_ptr<sensorlink::control::ControlSession>& session, const sensorlink::pipeline::v1::SensorMessage& message);

  void Close(const std::shared_ptr<sensorlink::control::ControlSession>& session);

  // Closes sessions silent for longer than heartbeat_timeout and abandons stale windows.
  std::size_t CheckHeartbeats();

  const ControlOptions& Options() const {
    return options_;
  }

 private:
  void HandleHeartbeat(const std::shared_ptr<sensorlink::control::ControlSession>& session, const sensorlink::pipeline::v1::Heartbeat& heartbeat);

  ServiceContext ctx_;
  ControlOptions options_;
};

} // namespace sensorlink::service
