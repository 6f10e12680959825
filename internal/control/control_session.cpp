#include "control_session.hpp"

namespace sensorlink::control {

ControlSession::ControlSession(std::string sensor_id, std::string session_id)
    : sensor_id_(std::move(sensor_id)), session_id_(std::move(session_id)), last_heartbeat_(sensorlink::util::Now()) {
}

bool ControlSession::Send(const sensorlink::pipeline::v1::ServerMessage& message) {
  if (closed_.load()) {
    return false;
  }
  if (!Write(message)) {
    closed_.store(true);
    return false;
  }
  return true;
}

void ControlSession::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    outstanding_.reset();
  }
  Cancel();
}

void ControlSession::Touch() {
  std::lock_guard lock(mutex_);
  last_heartbeat_ = sensorlink::util::Now();
}

sensorlink::util::TimePoint ControlSession::LastHeartbeat() const {
  std::lock_guard lock(mutex_);
  return last_heartbeat_;
}

void ControlSession::SetSoftwareVersion(std::string version) {
  std::lock_guard lock(mutex_);
  software_version_ = std::move(version);
}

std::string ControlSession::SoftwareVersion() const {
  std::lock_guard lock(mutex_);
  return software_version_;
}

void ControlSession::SetOutstandingWindow(OutstandingWindow window) {
  std::lock_guard lock(mutex_);
  outstanding_ = std::move(window);
}

std::optional<OutstandingWindow> ControlSession::Outstanding() const {
  std::lock_guard lock(mutex_);
  return outstanding_;
}

void ControlSession::ClearOutstandingWindow(const std::string& window_id) {
  std::lock_guard lock(mutex_);
  if (outstanding_.has_value() && (window_id.empty() || outstanding_->window_id == window_id)) {
    outstanding_.reset();
  }
}

} // namespace sensorlink::control
