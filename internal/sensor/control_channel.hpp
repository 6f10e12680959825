#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/backoff.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::sensor {

/*
  One open Connect call.

  Read blocks until a server message arrives or the call ends. Finish
  returns normally for a clean end, and throws util::UnauthorizedSensor when
  the collector refused the credential or util::TransportError otherwise.
*/
class ControlStream {
 public:
  virtual ~ControlStream() = default;

  virtual bool Write(const sensorlink::pipeline::v1::SensorMessage& message) = 0;
  virtual bool Read(sensorlink::pipeline::v1::ServerMessage* message)        = 0;
  virtual void Finish()                                                      = 0;
  virtual void Cancel()                                                      = 0;
};

class ControlConnector {
 public:
  virtual ~ControlConnector() = default;

  // Throws util::TransportError when the call cannot be started.
  virtual std::unique_ptr<ControlStream> Open(const std::string& sensor_id, const std::string& token) = 0;
};

struct ControlChannelOptions {
  std::string              sensor_id;
  std::string              token;
  std::string              software_version;
  std::vector<std::string> capabilities;

  // Replaced by the interval the collector announces on registration.
  std::chrono::milliseconds heartbeat_interval{10'000};
  util::BackoffPolicy       reconnect{std::chrono::milliseconds{1'000}, std::chrono::milliseconds{60'000}, 2.0, 0.2};
};

struct ControlHandlers {
  std::function<void(const sensorlink::pipeline::v1::RegisterAccepted&)> on_registered;
  std::function<void(const sensorlink::pipeline::v1::ChunkRequest&)>     on_chunk_request;
  std::function<void(const sensorlink::pipeline::v1::ChunkAck&)>         on_chunk_ack;
  std::function<void()>                                                  on_disconnected;
  std::function<sensorlink::pipeline::v1::Heartbeat()>                   heartbeat_source;
};

enum class ChannelState { Disconnected, Connecting, Registered, Active, Unauthorized, Stopped };

const char* ToString(ChannelState state);

/*
  Sensor end of the control channel.

  Keeps one session with the collector alive, reconnecting with backoff.
  A refused credential is terminal: the channel stays Unauthorized until it
  is rebuilt with a new token.
*/
class ControlChannel {
 public:
  ControlChannel(std::shared_ptr<ControlConnector> connector, ControlChannelOptions options, ControlHandlers handlers);
  ~ControlChannel();

  ControlChannel(const ControlChannel&)            = delete;
  ControlChannel& operator=(const ControlChannel&) = delete;

  // Starts the connection loop and the heartbeat thread.
  void Start();
  void Stop();

  // One session from connect to disconnect. Returns true if registration succeeded.
  bool RunOnce();

  bool SendAck(const sensorlink::pipeline::v1::ChunkAck& ack);
  bool SendHeartbeat();

  ChannelState State() const;
  std::string  SessionId() const;

 private:
  void ConnectionLoop();
  void HeartbeatLoop();
  bool Send(const sensorlink::pipeline::v1::SensorMessage& message);
  void SetState(ChannelState state);
  void Dispatch(const sensorlink::pipeline::v1::ServerMessage& message);

  std::shared_ptr<ControlConnector> connector_;
  ControlChannelOptions             options_;
  ControlHandlers                   handlers_;

  mutable std::mutex             mutex_;
  std::condition_variable        cv_;
  ChannelState                   state_ = ChannelState::Disconnected;
  std::shared_ptr<ControlStream> stream_;
  std::string                    session_id_;
  std::chrono::milliseconds      heartbeat_interval_;

  std::mutex write_mutex_;

  std::atomic<bool> stopping_{false};
  std::thread       connection_thread_;
  std::thread       heartbeat_thread_;
};

} // namespace sensorlink::sensor
