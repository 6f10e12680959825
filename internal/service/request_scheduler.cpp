#include "request_scheduler.hpp"

#include <algorithm>

#include "internal/control/session_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/offset_tracker.hpp"
#include "internal/util/time.hpp"

namespace sensorlink::service {

using namespace sensorlink::pipeline::v1;
using sensorlink::observability::StringField;
using sensorlink::observability::UintField;

RequestScheduler::RequestScheduler(std::shared_ptr<sensorlink::control::SessionRegistry> sessions,
                                   std::shared_ptr<sensorlink::store::OffsetTracker> offsets, SchedulerLimits limits)
    : sessions_(std::move(sessions)), offsets_(std::move(offsets)), limits_(limits) {
}

std::string RequestScheduler::NextWindowId(const std::string& sensor_id) {
  return sensor_id + "-" + std::to_string(sensorlink::util::NowMillis()) + "-" + std::to_string(++window_counter_);
}

std::optional<ChunkRequest> RequestScheduler::RequestSensor(const std::string& sensor_id, uint32_t max_chunks, uint64_t max_bytes) {
  auto session = sessions_->Find(sensor_id);
  if (!session || session->Closed()) {
    SENSORLINK_LOG_DEBUG("Chunk request skipped, sensor not connected", {StringField("sensor_id", sensor_id)});
    return std::nullopt;
  }

  ChunkRequest request;
  request.set_since_sequence(offsets_->SinceSequence(sensor_id));
  request.set_max_chunks(max_chunks ? std::min(max_chunks, limits_.max_chunks) : limits_.max_chunks);
  request.set_max_bytes(max_bytes ? std::min(max_bytes, limits_.max_bytes) : limits_.max_bytes);
  request.set_max_in_flight(limits_.max_in_flight);
  request.set_window_id(NextWindowId(sensor_id));

  ServerMessage message;
  *message.mutable_chunk_request() = request;
  if (!session->Send(message)) {
    return std::nullopt;
  }

  session->SetOutstandingWindow({request.window_id(), request.since_sequence(), sensorlink::util::Now()});
  SENSORLINK_LOG_DEBUG("Chunk request sent", {StringField("sensor_id", sensor_id), StringField("window_id", request.window_id()),
                                              UintField("since_sequence", request.since_sequence())});
  return request;
}

std::size_t RequestScheduler::RequestAll() {
  std::size_t sent = 0;
  for (const auto& session : sessions_->List()) {
    if (RequestSensor(session->SensorId()).has_value()) {
      ++sent;
    }
  }
  return sent;
}

bool RequestScheduler::HasFreshWindow(const sensorlink::control::ControlSession& session) const {
  auto window = session.Outstanding();
  return window.has_value() && sensorlink::util::Now() - window->issued_at < limits_.window_timeout;
}

std::size_t RequestScheduler::ExpireWindows() {
  std::size_t abandoned = 0;
  const auto  now       = sensorlink::util::Now();
  for (const auto& session : sessions_->List()) {
    auto window = session->Outstanding();
    if (!window.has_value() || now - window->issued_at < limits_.window_timeout) continue;

    session->ClearOutstandingWindow(window->window_id);
    sensorlink::observability::Metrics::Instance().RecordAbandonedWindow(session->SensorId());
    SENSORLINK_LOG_WARN("Window abandoned without response",
                        {StringField("sensor_id", session->SensorId()), StringField("window_id", window->window_id)});
    ++abandoned;
  }
  return abandoned;
}

} // namespace sensorlink::service
