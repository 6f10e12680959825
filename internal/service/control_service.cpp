#include "control_service.hpp"

#include "internal/auth/sensor_registry.hpp"
#include "internal/control/session_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/chunk_store.hpp"
#include "internal/store/offset_tracker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"
#include "request_scheduler.hpp"

namespace sensorlink::service {

using namespace sensorlink::pipeline::v1;
using sensorlink::control::ControlSession;
using sensorlink::observability::IntField;
using sensorlink::observability::StringField;
using sensorlink::observability::UintField;

ControlService::ControlService(ServiceContext ctx, ControlOptions options) : ctx_(std::move(ctx)), options_(options) {
}

void ControlService::Authenticate(const Register& registration, const CallCredentials& credentials) {
  ObserveRpc("ControlService.Register", registration.sensor_id(), [&] {
    if (registration.sensor_id().empty()) {
      throw sensorlink::util::InvalidArgument("register: sensor_id is required");
    }
    if (!credentials.sensor_id.empty() && credentials.sensor_id != registration.sensor_id()) {
      throw sensorlink::util::UnauthorizedSensor("register: x-sensor-id " + credentials.sensor_id + " does not match " + registration.sensor_id());
    }

    const std::string& token = registration.credential().empty() ? credentials.bearer_token : registration.credential();
    if (token.empty()) {
      throw sensorlink::util::UnauthorizedSensor("register: no credential presented by " + registration.sensor_id());
    }
    ctx_.sensors->Authenticate(registration.sensor_id(), token);
  });
}

void ControlService::Open(const std::shared_ptr<ControlSession>& session, const Register& registration) {
  session->SetSoftwareVersion(registration.software_version());
  session->Touch();
  ctx_.sessions->Insert(session);

  ServerMessage reply;
  auto*         accepted = reply.mutable_accepted();
  accepted->set_session_id(session->SessionId());
  accepted->set_committed_sequence(ctx_.offsets->SinceSequence(session->SensorId()));
  accepted->set_heartbeat_interval_ms(static_cast<uint32_t>(options_.heartbeat_interval.count()));
  session->Send(reply);

  std::string capabilities;
  for (const auto& capability : registration.capabilities()) {
    if (!capabilities.empty()) capabilities += ",";
    capabilities += capability;
  }
  SENSORLINK_LOG_INFO("Sensor registered", {StringField("sensor_id", session->SensorId()), StringField("session_id", session->SessionId()),
                                            StringField("software_version", registration.software_version()),
                                            StringField("capabilities", capabilities),
                                            UintField("committed_sequence", accepted->committed_sequence())});

  ctx_.scheduler->RequestSensor(session->SensorId());
}

void ControlService::HandleMessage(const std::shared_ptr<ControlSession>& session, const SensorMessage& message) {
  switch (message.body_case()) {
    case SensorMessage::kHeartbeat:
      HandleHeartbeat(session, message.heartbeat());
      return;

    case SensorMessage::kAck:
      session->ClearOutstandingWindow(message.ack().window_id());
      SENSORLINK_LOG_DEBUG("Sensor acknowledged window", {StringField("sensor_id", session->SensorId()), StringField("window_id", message.ack().window_id()),
                                                          UintField("committed_upto", message.ack().committed_upto_sequence())});
      return;

    case SensorMessage::kRegistration:
      throw sensorlink::util::InvalidState("control: session " + session->SessionId() + " is already registered");

    case SensorMessage::BODY_NOT_SET:
      break;
  }
  throw sensorlink::util::InvalidArgument("control: empty sensor message");
}

void ControlService::HandleHeartbeat(const std::shared_ptr<ControlSession>& session, const Heartbeat& heartbeat) {
  session->Touch();
  if (!heartbeat.software_version().empty()) {
    session->SetSoftwareVersion(heartbeat.software_version());
  }

  const auto& sensor_id = session->SensorId();
  sensorlink::observability::Metrics::Instance().SetQueueDepth(sensor_id, heartbeat.queue_depth());

  SENSORLINK_LOG_DEBUG("Heartbeat", {StringField("sensor_id", sensor_id), UintField("queue_depth", heartbeat.queue_depth()),
                                     UintField("oldest_pending_age_ms", heartbeat.oldest_pending_age_ms()),
                                     UintField("last_committed", heartbeat.last_committed_sequence()),
                                     IntField("clock_skew_ms", heartbeat.clock_skew_ms())});

  if (heartbeat.expired_upto_sequence() > ctx_.offsets->SinceSequence(sensor_id)) {
    ctx_.chunk_store->ApplyExpired(sensor_id, heartbeat.expired_upto_sequence());
  }

  if (heartbeat.queue_depth() > 0 && !ctx_.scheduler->HasFreshWindow(*session)) {
    ctx_.scheduler->RequestSensor(sensor_id);
  }
}

void ControlService::Close(const std::shared_ptr<ControlSession>& session) {
  const bool removed = ctx_.sessions->Remove(session);
  session->Close();
  if (removed) {
    SENSORLINK_LOG_INFO("Sensor disconnected", {StringField("sensor_id", session->SensorId()), StringField("session_id", session->SessionId())});
  }
}

std::size_t ControlService::CheckHeartbeats() {
  std::size_t closed = 0;
  const auto  now    = sensorlink::util::Now();

  for (const auto& session : ctx_.sessions->List()) {
    if (now - session->LastHeartbeat() <= options_.heartbeat_timeout) continue;

    sensorlink::observability::Metrics::Instance().RecordMissedHeartbeat(session->SensorId());
    SENSORLINK_LOG_WARN("Missed heartbeats, closing control session",
                        {StringField("sensor_id", session->SensorId()), StringField("session_id", session->SessionId())});
    if (ctx_.sessions->Remove(session)) {
      ++closed;
    }
    session->Close();
  }

  ctx_.scheduler->ExpireWindows();
  return closed;
}

} // namespace sensorlink::service
