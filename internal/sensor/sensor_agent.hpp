#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "control_channel.hpp"
#include "data_channel.hpp"
#include "dispatcher.hpp"
#include "durable_queue.hpp"
#include "internal/codec/chunk_codec.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "spool_source.hpp"

namespace sensorlink::sensor {

struct SensorAgentOptions {
  std::string sensor_id;
  std::string software_version;
  std::size_t        max_chunk_bytes = codec::kDefaultChunkBytes;
  codec::Compression compression     = codec::Compression::Gzip;
  int64_t            clock_skew_ms   = 0;

  std::chrono::milliseconds retention{72LL * 60 * 60 * 1000};
  // probe, expiry and spool scan cadence
  std::chrono::milliseconds maintenance_interval{5'000};
};

/*
  Sensor process wiring: payloads go through the codec into the durable
  queue, the control channel drives the dispatcher, and a maintenance task
  expires old entries, drains the spool and probes when idle.
*/
class SensorAgent {
 public:
  SensorAgent(SensorAgentOptions options, std::shared_ptr<DurableQueue> queue, std::shared_ptr<DataChannel> data_channel,
              std::shared_ptr<ControlConnector> connector, ControlChannelOptions control_options, DispatcherOptions dispatch_options = {},
              std::unique_ptr<SpoolSource> spool = nullptr);
  ~SensorAgent();

  SensorAgent(const SensorAgent&)            = delete;
  SensorAgent& operator=(const SensorAgent&) = delete;

  // Splits and durably enqueues one event. Returns its event id.
  std::string Submit(std::string_view payload, int64_t logical_timestamp_ms = 0, std::map<std::string, std::string> attributes = {});

  sensorlink::pipeline::v1::Heartbeat BuildHeartbeat();

  // One maintenance pass.
  void RunMaintenance();

  void Start();
  void Stop();

  DurableQueue& Queue() {
    return *queue_;
  }
  Dispatcher& Dispatch() {
    return *dispatcher_;
  }
  ControlChannel& Control() {
    return *control_;
  }

 private:
  void OnRegistered(const sensorlink::pipeline::v1::RegisterAccepted& accepted);

  SensorAgentOptions              options_;
  std::shared_ptr<DurableQueue>   queue_;
  std::unique_ptr<Dispatcher>     dispatcher_;
  std::unique_ptr<ControlChannel> control_;
  std::unique_ptr<SpoolSource>    spool_;
  std::unique_ptr<runtime::PeriodicTask> maintenance_;
};

} // namespace sensorlink::sensor
