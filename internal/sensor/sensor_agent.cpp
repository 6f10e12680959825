#include "sensor_agent.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sensorlink::sensor {

using namespace sensorlink::pipeline::v1;
using sensorlink::observability::StringField;
using sensorlink::observability::UintField;

SensorAgent::SensorAgent(SensorAgentOptions options, std::shared_ptr<DurableQueue> queue, std::shared_ptr<DataChannel> data_channel,
                         std::shared_ptr<ControlConnector> connector, ControlChannelOptions control_options, DispatcherOptions dispatch_options,
                         std::unique_ptr<SpoolSource> spool)
    : options_(std::move(options)), queue_(std::move(queue)), spool_(std::move(spool)) {
  if (options_.sensor_id.empty()) {
    throw std::invalid_argument("SensorAgent requires a sensor id");
  }

  dispatch_options.on_committed = [this](const ChunkAck& ack) {
    if (control_) control_->SendAck(ack);
  };
  dispatcher_ = std::make_unique<Dispatcher>(options_.sensor_id, queue_, std::move(data_channel), std::move(dispatch_options));

  control_options.sensor_id = options_.sensor_id;
  if (control_options.software_version.empty()) {
    control_options.software_version = options_.software_version;
  }

  ControlHandlers handlers;
  handlers.on_registered    = [this](const RegisterAccepted& accepted) { OnRegistered(accepted); };
  handlers.on_chunk_request = [this](const ChunkRequest& request) { dispatcher_->HandleChunkRequest(request); };
  handlers.on_chunk_ack     = [this](const ChunkAck& ack) { dispatcher_->HandleChunkAck(ack); };
  handlers.on_disconnected  = [this] { dispatcher_->CancelPending(); };
  handlers.heartbeat_source = [this] { return BuildHeartbeat(); };

  control_ = std::make_unique<ControlChannel>(std::move(connector), std::move(control_options), std::move(handlers));

  maintenance_ = std::make_unique<runtime::PeriodicTask>("sensor-maintenance", options_.maintenance_interval, [this] { RunMaintenance(); });
}

SensorAgent::~SensorAgent() {
  Stop();
}

std::string SensorAgent::Submit(std::string_view payload, int64_t logical_timestamp_ms, std::map<std::string, std::string> attributes) {
  observability::SpanScope span("sensorlink.sensor.submit");

  codec::EventOptions event;
  event.sensor_id            = options_.sensor_id;
  event.logical_timestamp_ms = logical_timestamp_ms;
  event.clock_skew_ms        = options_.clock_skew_ms;
  event.attributes           = std::move(attributes);
  event.compression          = options_.compression;

  auto chunks = codec::Split(payload, options_.max_chunk_bytes, event);
  queue_->Enqueue(chunks);

  const auto& event_id = chunks.front().event_id();
  span.SetAttribute("event_id", event_id);
  SENSORLINK_LOG_INFO("Event queued", {StringField("event_id", event_id), UintField("bytes", payload.size()), UintField("chunks", chunks.size()),
                                       UintField("last_sequence", chunks.back().sequence())});
  return event_id;
}

Heartbeat SensorAgent::BuildHeartbeat() {
  const auto depth = queue_->QueueDepth();

  Heartbeat heartbeat;
  heartbeat.set_software_version(options_.software_version);
  heartbeat.set_last_committed_sequence(queue_->LastAckedSequence());
  heartbeat.set_queue_depth(depth);
  heartbeat.set_oldest_pending_age_ms(static_cast<uint64_t>(queue_->OldestPendingAge().count()));
  heartbeat.set_expired_upto_sequence(queue_->ExpiredUpto());
  heartbeat.set_clock_skew_ms(options_.clock_skew_ms);

  observability::Metrics::Instance().SetQueueDepth(options_.sensor_id, depth);
  return heartbeat;
}

void SensorAgent::OnRegistered(const RegisterAccepted& accepted) {
  const uint64_t committed = accepted.committed_sequence();
  if (committed == 0) {
    return;
  }

  const auto acked = queue_->AckUpto(committed);
  queue_->EnsureSequenceFloor(committed);
  if (acked > 0) {
    SENSORLINK_LOG_INFO("Dropped entries the collector already committed", {UintField("count", acked), UintField("committed_sequence", committed)});
  }
}

void SensorAgent::RunMaintenance() {
  queue_->ExpireOlderThan(options_.retention);

  if (spool_) {
    spool_->Drain([this](const std::filesystem::path& path, std::string contents) { Submit(contents, 0, {{"source_file", path.filename().string()}}); });
  }

  dispatcher_->Probe();
}

void SensorAgent::Start() {
  dispatcher_->Start();
  control_->Start();
  maintenance_->Start();
  SENSORLINK_LOG_INFO("Sensor agent started", {StringField("sensor_id", options_.sensor_id), UintField("queue_depth", queue_->QueueDepth())});
}

void SensorAgent::Stop() {
  maintenance_->Stop();
  control_->Stop();
  dispatcher_->Stop();
}

} // namespace sensorlink::sensor
