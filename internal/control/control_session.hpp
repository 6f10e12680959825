#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::control {

// A ChunkRequest sent to the sensor and not yet acknowledged.
struct OutstandingWindow {
  std::string               window_id;
  uint64_t                  since_sequence = 0;
  sensorlink::util::TimePoint issued_at;
};

/*
  Server end of one registered control stream.

  The transport (gRPC stream, test fake) implements Write and Cancel.
  Everything else is bookkeeping shared by all transports.
*/
class ControlSession {
 public:
  ControlSession(std::string sensor_id, std::string session_id);
  virtual ~ControlSession() = default;

  ControlSession(const ControlSession&)            = delete;
  ControlSession& operator=(const ControlSession&) = delete;

  const std::string& SensorId() const {
    return sensor_id_;
  }
  const std::string& SessionId() const {
    return session_id_;
  }

  // Returns false once the stream is closed.
  bool Send(const sensorlink::pipeline::v1::ServerMessage& message);

  // Cancels the outstanding window and closes the stream. Idempotent.
  void Close();
  bool Closed() const {
    return closed_.load();
  }

  void                        Touch();
  sensorlink::util::TimePoint LastHeartbeat() const;

  void SetSoftwareVersion(std::string version);
  std::string SoftwareVersion() const;

  void                             SetOutstandingWindow(OutstandingWindow window);
  std::optional<OutstandingWindow> Outstanding() const;
  // Clears the window when window_id matches; empty window_id clears any.
  void ClearOutstandingWindow(const std::string& window_id);

 protected:
  virtual bool Write(const sensorlink::pipeline::v1::ServerMessage& message) = 0;
  virtual void Cancel()                                                       = 0;

 private:
  const std::string sensor_id_;
  const std::string session_id_;

  mutable std::mutex               mutex_;
  sensorlink::util::TimePoint      last_heartbeat_;
  std::string                      software_version_;
  std::optional<OutstandingWindow> outstanding_;
  std::atomic<bool>                closed_{false};
};

} // namespace sensorlink::control
