#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::control {
class ControlSession;
class SessionRegistry;
}
namespace sensorlink::store {
class OffsetTracker;
}

namespace sensorlink::service {

struct SchedulerLimits {
  uint32_t                  max_chunks    = 32;
  uint64_t                  max_bytes     = 2 * 1024 * 1024;
  uint32_t                  max_in_flight = 32;
  std::chrono::milliseconds window_timeout{30'000};
};

/*
  Issues ChunkRequests to connected sensors.

  A request always starts at the collector's committed point, so asking
  again after a lost chunk resends the gap and everything after it.
*/
class RequestScheduler {
 public:
  RequestScheduler(std::shared_ptr<sensorlink::control::SessionRegistry> sessions, std::shared_ptr<sensorlink::store::OffsetTracker> offsets,
                   SchedulerLimits limits = {});

  // nullopt when the sensor has no live session. Zero overrides use the defaults.
  std::optional<sensorlink::pipeline::v1::ChunkRequest> RequestSensor(const std::string& sensor_id, uint32_t max_chunks = 0,
                                                                      uint64_t max_bytes = 0);

  // Requests every live session; returns how many requests went out.
  std::size_t RequestAll();

  // True while the session has a window younger than window_timeout.
  bool HasFreshWindow(const sensorlink::control::ControlSession& session) const;

  // Drops windows older than window_timeout; returns how many were abandoned.
  std::size_t ExpireWindows();

  const SchedulerLimits& Limits() const {
    return limits_;
  }

 private:
  std::string NextWindowId(const std::string& sensor_id);

  std::shared_ptr<sensorlink::control::SessionRegistry> sessions_;
  std::shared_ptr<sensorlink::store::OffsetTracker>     offsets_;
  SchedulerLimits                                       limits_;
  std::atomic<uint64_t>                                 window_counter_{0};
};

} // namespace sensorlink::service
