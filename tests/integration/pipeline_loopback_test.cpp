#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/auth/sensor_registry.hpp"
#include "internal/control/control_session.hpp"
#include "internal/control/session_registry.hpp"
#include "internal/db/memory/memory_chunk_repository.hpp"
#include "internal/db/memory/memory_queue_repository.hpp"
#include "internal/sensor/sensor_agent.hpp"
#include "internal/service/control_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/request_scheduler.hpp"
#include "internal/snapshot/snapshot_cache.hpp"
#include "internal/store/chunk_store.hpp"
#include "internal/store/offset_tracker.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace sensorlink::pipeline::v1;
using sensorlink::sensor::ChannelState;
using sensorlink::sensor::ControlChannelOptions;
using sensorlink::sensor::ControlConnector;
using sensorlink::sensor::ControlStream;
using sensorlink::sensor::DataChannel;
using sensorlink::sensor::DispatcherOptions;
using sensorlink::sensor::DurableQueue;
using sensorlink::sensor::SensorAgent;
using sensorlink::sensor::SensorAgentOptions;
using sensorlink::service::ServiceContext;

constexpr char kSensorId[] = "sensor-a";
constexpr char kToken[]    = "secret-a";

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

// Server-to-sensor half of an in-process control call.
struct Pipe {
  std::mutex                mutex;
  std::condition_variable   cv;
  std::deque<ServerMessage> inbox;
  bool                      closed  = false;
  bool                      refused = false;

  bool Push(const ServerMessage& message) {
    {
      std::lock_guard lock(mutex);
      if (closed) return false;
      inbox.push_back(message);
    }
    cv.notify_all();
    return true;
  }

  void Close() {
    {
      std::lock_guard lock(mutex);
      closed = true;
    }
    cv.notify_all();
  }
};

class PipeSession final : public sensorlink::control::ControlSession {
 public:
  PipeSession(std::string sensor_id, std::string session_id, std::shared_ptr<Pipe> pipe)
      : ControlSession(std::move(sensor_id), std::move(session_id)), pipe_(std::move(pipe)) {}

 protected:
  bool Write(const ServerMessage& message) override {
    return pipe_->Push(message);
  }
  void Cancel() override {
    pipe_->Close();
  }

 private:
  std::shared_ptr<Pipe> pipe_;
};

// Sensor end: writes go straight into the collector's ControlService.
class PipeStream final : public ControlStream {
 public:
  PipeStream(std::shared_ptr<sensorlink::service::ControlService> control, std::string session_id)
      : control_(std::move(control)), session_id_(std::move(session_id)) {}

  bool Write(const SensorMessage& message) override {
    if (message.has_registration()) {
      try {
        control_->Authenticate(message.registration(), {});
      } catch (const sensorlink::util::UnauthorizedSensor&) {
        {
          std::lock_guard lock(pipe_->mutex);
          pipe_->refused = true;
        }
        pipe_->Close();
        return false;
      }
      session_ = std::make_shared<PipeSession>(message.registration().sensor_id(), session_id_, pipe_);
      control_->Open(session_, message.registration());
      return true;
    }
    if (!session_ || session_->Closed()) {
      return false;
    }
    try {
      control_->HandleMessage(session_, message);
    } catch (const std::exception&) {
      // the collector ends the call on a bad message
      session_->Close();
      return false;
    }
    return true;
  }

  bool Read(ServerMessage* message) override {
    std::unique_lock lock(pipe_->mutex);
    pipe_->cv.wait(lock, [this] { return pipe_->closed || !pipe_->inbox.empty(); });
    if (pipe_->inbox.empty()) {
      return false;
    }
    *message = std::move(pipe_->inbox.front());
    pipe_->inbox.pop_front();
    return true;
  }

  void Finish() override {
    if (session_) {
      control_->Close(session_);
    }
    std::lock_guard lock(pipe_->mutex);
    if (pipe_->refused) {
      throw sensorlink::util::UnauthorizedSensor("sensor credential refused");
    }
  }

  void Cancel() override {
    pipe_->Close();
  }

 private:
  std::shared_ptr<sensorlink::service::ControlService> control_;
  std::string                                          session_id_;
  std::shared_ptr<Pipe>                                pipe_ = std::make_shared<Pipe>();
  std::shared_ptr<PipeSession>                         session_;
};

class PipeConnector final : public ControlConnector {
 public:
  explicit PipeConnector(std::shared_ptr<sensorlink::service::ControlService> control) : control_(std::move(control)) {}

  std::unique_ptr<ControlStream> Open(const std::string&, const std::string&) override {
    return std::make_unique<PipeStream>(control_, "loop-" + std::to_string(++opens));
  }

  std::atomic<int> opens{0};

 private:
  std::shared_ptr<sensorlink::service::ControlService> control_;
};

class LoopbackDataChannel final : public DataChannel {
 public:
  LoopbackDataChannel(std::shared_ptr<sensorlink::service::IngestService> ingest, std::string token)
      : ingest_(std::move(ingest)), token_(std::move(token)) {}

  IngestBatchResponse Send(const IngestBatchRequest& request, std::chrono::milliseconds) override {
    if (!up) {
      throw sensorlink::util::TransportError("collector unreachable");
    }
    return ingest_->IngestBatch(token_, request);
  }

  std::atomic<bool> up{true};

 private:
  std::shared_ptr<sensorlink::service::IngestService> ingest_;
  std::string                                         token_;
};

struct Collector {
  explicit Collector(std::shared_ptr<sensorlink::db::ChunkRepository> repo = std::make_shared<sensorlink::db::memory::MemoryChunkRepository>()) {
    ctx.offsets     = std::make_shared<sensorlink::store::OffsetTracker>(repo);
    ctx.snapshots   = std::make_shared<sensorlink::snapshot::SnapshotCache>();
    ctx.chunk_store = std::make_shared<sensorlink::store::ChunkStore>(repo, ctx.offsets, ctx.snapshots);
    ctx.sensors     = std::make_shared<sensorlink::auth::SensorRegistry>();
    ctx.sessions    = std::make_shared<sensorlink::control::SessionRegistry>();

    sensorlink::service::SchedulerLimits limits;
    limits.window_timeout = 300ms;
    ctx.scheduler         = std::make_shared<sensorlink::service::RequestScheduler>(ctx.sessions, ctx.offsets, limits);

    ctx.offsets->Load();
    ctx.chunk_store->Hydrate();
    ctx.sensors->Upsert(kSensorId, kToken);

    sensorlink::service::ControlOptions options;
    options.heartbeat_interval = 50ms;
    options.heartbeat_timeout  = 5s;
    control                    = std::make_shared<sensorlink::service::ControlService>(ctx, options);
    ingest                     = std::make_shared<sensorlink::service::IngestService>(ctx);
  }

  ServiceContext                                       ctx;
  std::shared_ptr<sensorlink::service::ControlService> control;
  std::shared_ptr<sensorlink::service::IngestService>  ingest;
};

struct Sensor {
  Sensor(Collector& collector, std::shared_ptr<sensorlink::db::QueueRepository> queue_repo = std::make_shared<sensorlink::db::memory::MemoryQueueRepository>())
      : queue(std::make_shared<DurableQueue>(std::move(queue_repo))),
        data(std::make_shared<LoopbackDataChannel>(collector.ingest, kToken)),
        connector(std::make_shared<PipeConnector>(collector.control)) {
    SensorAgentOptions options;
    options.sensor_id            = kSensorId;
    options.software_version     = "1.0.0";
    options.max_chunk_bytes      = 8;
    options.maintenance_interval = 25ms;

    ControlChannelOptions control;
    control.token     = kToken;
    control.reconnect = sensorlink::util::BackoffPolicy{10ms, 50ms, 2.0, 0.0};

    DispatcherOptions dispatch;
    dispatch.max_chunks     = 4;
    dispatch.max_attempts   = 2;
    dispatch.backoff        = sensorlink::util::BackoffPolicy{5ms, 10ms, 2.0, 0.0};
    dispatch.window_timeout = 200ms;

    agent = std::make_unique<SensorAgent>(options, queue, data, connector, control, dispatch);
  }

  std::shared_ptr<DurableQueue>        queue;
  std::shared_ptr<LoopbackDataChannel> data;
  std::shared_ptr<PipeConnector>       connector;
  std::unique_ptr<SensorAgent>         agent;
};

bool SnapshotIs(const Collector& collector, const std::string& event_id) {
  const auto snapshot = collector.ctx.snapshots->Get(kSensorId);
  return snapshot && snapshot->event_id() == event_id;
}

void TestEventsReachSnapshotCache() {
  Collector collector;
  Sensor    sensor(collector);

  sensor.agent->Submit("first reading, several chunks", 100);
  const auto second = sensor.agent->Submit("second reading", 200, {{"unit", "dBm"}});
  sensor.agent->Start();

  assert(WaitFor([&] { return SnapshotIs(collector, second) && sensor.queue->QueueDepth() == 0; }));

  const auto snapshot = collector.ctx.snapshots->Get(kSensorId);
  assert(snapshot->payload() == "second reading");
  assert(snapshot->logical_timestamp_ms() == 200);
  assert(snapshot->attributes().at("unit") == "dBm");
  assert(snapshot->last_sequence() == sensor.queue->LastSequence());
  assert(collector.ctx.chunk_store->CommittedSequence(kSensorId) == sensor.queue->LastSequence());
  assert(sensor.queue->LastAckedSequence() == sensor.queue->LastSequence());

  // submitted while connected
  const auto third = sensor.agent->Submit("third", 300);
  assert(WaitFor([&] { return SnapshotIs(collector, third) && sensor.queue->QueueDepth() == 0; }));
  assert(collector.ctx.offsets->SinceSequence(kSensorId) == sensor.queue->LastSequence());

  sensor.agent->Stop();
}

void TestOutageIsReplayed() {
  Collector collector;
  Sensor    sensor(collector);
  sensor.data->up = false;

  sensor.agent->Submit("queued during outage", 1);
  const auto last = sensor.agent->Submit("also queued", 2);
  const auto depth = sensor.queue->QueueDepth();
  sensor.agent->Start();

  assert(WaitFor([&] { return sensor.agent->Control().State() == ChannelState::Active; }));
  std::this_thread::sleep_for(150ms);
  assert(!collector.ctx.snapshots->Get(kSensorId).has_value());
  assert(sensor.queue->QueueDepth() == depth);

  sensor.data->up = true;
  assert(WaitFor([&] { return SnapshotIs(collector, last) && sensor.queue->QueueDepth() == 0; }));
  assert(collector.ctx.chunk_store->CommittedSequence(kSensorId) == sensor.queue->LastSequence());

  sensor.agent->Stop();
}

void TestRestartsResumeFromCommittedPoint() {
  auto chunk_repo = std::make_shared<sensorlink::db::memory::MemoryChunkRepository>();
  auto queue_repo = std::make_shared<sensorlink::db::memory::MemoryQueueRepository>();

  std::string first;
  uint64_t    first_last_sequence = 0;
  {
    Collector collector(chunk_repo);
    Sensor    sensor(collector, queue_repo);
    first = sensor.agent->Submit("before restart", 10);
    sensor.agent->Start();
    assert(WaitFor([&] { return SnapshotIs(collector, first) && sensor.queue->QueueDepth() == 0; }));
    first_last_sequence = sensor.queue->LastSequence();
    sensor.agent->Stop();
  }

  Collector collector(chunk_repo);
  // hydrated from the store before any sensor connects
  assert(SnapshotIs(collector, first));
  assert(collector.ctx.offsets->SinceSequence(kSensorId) == first_last_sequence);

  Sensor sensor(collector, queue_repo);
  const auto second = sensor.agent->Submit("after restart", 20);
  assert(sensor.queue->PeekRange(0, 1, 0).front().sequence() == first_last_sequence + 1);

  sensor.agent->Start();
  assert(WaitFor([&] { return SnapshotIs(collector, second) && sensor.queue->QueueDepth() == 0; }));
  assert(collector.ctx.chunk_store->CommittedSequence(kSensorId) == sensor.queue->LastSequence());
  sensor.agent->Stop();
}

void TestRevokedSensorStopsReconnecting() {
  Collector collector;
  collector.ctx.sensors->Revoke(kSensorId);
  Sensor sensor(collector);

  sensor.agent->Submit("never delivered", 1);
  sensor.agent->Start();
  assert(WaitFor([&] { return sensor.agent->Control().State() == ChannelState::Unauthorized; }));

  std::this_thread::sleep_for(100ms);
  assert(sensor.connector->opens == 1);
  assert(sensor.queue->QueueDepth() > 0);
  sensor.agent->Stop();
}

} // namespace

int main() {
  TestEventsReachSnapshotCache();
  TestOutageIsReplayed();
  TestRestartsResumeFromCommittedPoint();
  TestRevokedSensorStopsReconnecting();

  std::cout << "sensorlink_integration_pipeline_loopback: pass\n";
  return 0;
}
