#include "control_channel.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sensorlink::sensor {

using namespace sensorlink::pipeline::v1;
using sensorlink::observability::IntField;
using sensorlink::observability::StringField;
using sensorlink::observability::UintField;

const char* ToString(ChannelState state) {
  switch (state) {
    case ChannelState::Disconnected:
      return "disconnected";
    case ChannelState::Connecting:
      return "connecting";
    case ChannelState::Registered:
      return "registered";
    case ChannelState::Active:
      return "active";
    case ChannelState::Unauthorized:
      return "unauthorized";
    case ChannelState::Stopped:
      return "stopped";
  }
  return "unknown";
}

ControlChannel::ControlChannel(std::shared_ptr<ControlConnector> connector, ControlChannelOptions options, ControlHandlers handlers)
    : connector_(std::move(connector)),
      options_(std::move(options)),
      handlers_(std::move(handlers)),
      heartbeat_interval_(options_.heartbeat_interval) {
  if (!connector_) {
    throw std::invalid_argument("ControlChannel requires a connector");
  }
}

ControlChannel::~ControlChannel() {
  Stop();
}

void ControlChannel::Start() {
  if (connection_thread_.joinable()) {
    return;
  }
  stopping_          = false;
  connection_thread_ = std::thread([this] { ConnectionLoop(); });
  heartbeat_thread_  = std::thread([this] { HeartbeatLoop(); });
}

void ControlChannel::Stop() {
  std::shared_ptr<ControlStream> stream;
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    stream    = stream_;
  }
  if (stream) {
    stream->Cancel();
  }
  cv_.notify_all();

  if (connection_thread_.joinable()) connection_thread_.join();
  if (heartbeat_thread_.joinable()) heartbeat_thread_.join();

  SetState(ChannelState::Stopped);
}

ChannelState ControlChannel::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::string ControlChannel::SessionId() const {
  std::lock_guard lock(mutex_);
  return session_id_;
}

void ControlChannel::SetState(ChannelState state) {
  std::lock_guard lock(mutex_);
  // terminal states stick
  if (state_ == ChannelState::Stopped || (state_ == ChannelState::Unauthorized && state != ChannelState::Stopped)) {
    return;
  }
  state_ = state;
}

bool ControlChannel::RunOnce() {
  {
    std::lock_guard lock(mutex_);
    if (stopping_ || state_ == ChannelState::Unauthorized) {
      return false;
    }
    state_ = ChannelState::Connecting;
  }

  std::shared_ptr<ControlStream> stream;
  try {
    stream = connector_->Open(options_.sensor_id, options_.token);
  } catch (const util::TransportError& e) {
    SENSORLINK_LOG_WARN("Control channel connect failed", {StringField("error", e.what())});
    SetState(ChannelState::Disconnected);
    return false;
  }
  bool stopped_while_opening = false;
  {
    std::lock_guard lock(mutex_);
    // Stop() ran during Open and saw no stream to cancel
    stopped_while_opening = stopping_;
    if (!stopped_while_opening) {
      stream_ = stream;
    }
  }
  if (stopped_while_opening) {
    stream->Cancel();
    try {
      stream->Finish();
    } catch (const std::runtime_error& e) {
      SENSORLINK_LOG_DEBUG("Control stream cancelled during stop", {StringField("error", e.what())});
    }
    SetState(ChannelState::Stopped);
    return false;
  }

  SensorMessage hello;
  auto*         registration = hello.mutable_registration();
  registration->set_sensor_id(options_.sensor_id);
  registration->set_credential(options_.token);
  registration->set_software_version(options_.software_version);
  for (const auto& capability : options_.capabilities) {
    registration->add_capabilities(capability);
  }

  bool registered = false;
  if (Send(hello)) {
    ServerMessage first;
    if (stream->Read(&first) && first.has_accepted()) {
      const auto& accepted = first.accepted();
      {
        std::lock_guard lock(mutex_);
        session_id_ = accepted.session_id();
        if (accepted.heartbeat_interval_ms() > 0) {
          heartbeat_interval_ = std::chrono::milliseconds{accepted.heartbeat_interval_ms()};
        }
      }
      SetState(ChannelState::Registered);
      registered = true;

      SENSORLINK_LOG_INFO("Control session registered", {StringField("sensor_id", options_.sensor_id), StringField("session_id", accepted.session_id()),
                                                         UintField("committed_sequence", accepted.committed_sequence())});
      Dispatch(first);
      SetState(ChannelState::Active);
      cv_.notify_all();

      ServerMessage message;
      while (stream->Read(&message)) {
        Dispatch(message);
      }
    }
  }

  {
    std::lock_guard lock(mutex_);
    stream_.reset();
    session_id_.clear();
  }

  ChannelState end = ChannelState::Disconnected;
  try {
    stream->Finish();
  } catch (const util::UnauthorizedSensor& e) {
    SENSORLINK_LOG_ERROR("Collector refused sensor credential", {StringField("sensor_id", options_.sensor_id), StringField("error", e.what())});
    end = ChannelState::Unauthorized;
  } catch (const util::TransportError& e) {
    if (!stopping_) {
      SENSORLINK_LOG_WARN("Control session ended", {StringField("sensor_id", options_.sensor_id), StringField("error", e.what())});
    }
  }
  SetState(stopping_ ? ChannelState::Stopped : end);

  if (registered && handlers_.on_disconnected) {
    handlers_.on_disconnected();
  }
  return registered;
}

void ControlChannel::Dispatch(const ServerMessage& message) {
  try {
    switch (message.body_case()) {
      case ServerMessage::kAccepted:
        if (handlers_.on_registered) handlers_.on_registered(message.accepted());
        break;
      case ServerMessage::kChunkRequest:
        if (handlers_.on_chunk_request) handlers_.on_chunk_request(message.chunk_request());
        break;
      case ServerMessage::kAck:
        if (handlers_.on_chunk_ack) handlers_.on_chunk_ack(message.ack());
        break;
      case ServerMessage::BODY_NOT_SET:
        SENSORLINK_LOG_WARN("Empty control message from collector");
        break;
    }
  } catch (const std::exception& e) {
    SENSORLINK_LOG_ERROR("Control message handler failed", {IntField("body", static_cast<int64_t>(message.body_case())), StringField("error", e.what())});
  }
}

bool ControlChannel::Send(const SensorMessage& message) {
  std::shared_ptr<ControlStream> stream;
  {
    std::lock_guard lock(mutex_);
    stream = stream_;
  }
  if (!stream) {
    return false;
  }
  std::lock_guard write_lock(write_mutex_);
  return stream->Write(message);
}

bool ControlChannel::SendAck(const ChunkAck& ack) {
  if (State() != ChannelState::Active) {
    return false;
  }
  SensorMessage message;
  *message.mutable_ack() = ack;
  return Send(message);
}

bool ControlChannel::SendHeartbeat() {
  if (State() != ChannelState::Active) {
    return false;
  }

  SensorMessage message;
  auto*         heartbeat = message.mutable_heartbeat();
  if (handlers_.heartbeat_source) {
    *heartbeat = handlers_.heartbeat_source();
  }
  if (heartbeat->software_version().empty()) {
    heartbeat->set_software_version(options_.software_version);
  }
  heartbeat->set_sent_at_ms(util::NowMillis());
  return Send(message);
}

void ControlChannel::ConnectionLoop() {
  util::Backoff backoff(options_.reconnect);

  while (!stopping_) {
    bool registered = false;
    try {
      registered = RunOnce();
    } catch (const std::exception& e) {
      SENSORLINK_LOG_ERROR("Control session failed", {StringField("sensor_id", options_.sensor_id), StringField("error", e.what())});
      SetState(ChannelState::Disconnected);
    }

    if (stopping_ || State() == ChannelState::Unauthorized) {
      break;
    }
    if (registered) {
      backoff.Reset();
    }

    const auto delay = backoff.Next();
    SENSORLINK_LOG_INFO("Reconnecting control channel", {IntField("delay_ms", delay.count()), IntField("attempt", backoff.Attempts())});

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, delay, [this] { return stopping_.load(); });
  }
}

void ControlChannel::HeartbeatLoop() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    cv_.wait_for(lock, heartbeat_interval_, [this] { return stopping_.load(); });
    if (stopping_) {
      break;
    }
    if (state_ != ChannelState::Active) {
      continue;
    }

    lock.unlock();
    if (!SendHeartbeat()) {
      SENSORLINK_LOG_DEBUG("Heartbeat not sent", {StringField("sensor_id", options_.sensor_id)});
    }
    lock.lock();
  }
}

} // namespace sensorlink::sensor
