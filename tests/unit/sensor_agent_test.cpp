#include "internal/sensor/sensor_agent.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/codec/chunk_codec.hpp"
#include "internal/db/memory/memory_queue_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using namespace sensorlink::pipeline::v1;
using sensorlink::sensor::ControlChannelOptions;
using sensorlink::sensor::ControlConnector;
using sensorlink::sensor::ControlStream;
using sensorlink::sensor::DataChannel;
using sensorlink::sensor::DurableQueue;
using sensorlink::sensor::SensorAgent;
using sensorlink::sensor::SensorAgentOptions;
using sensorlink::sensor::SpoolOptions;
using sensorlink::sensor::SpoolSource;

class CommitAllChannel final : public DataChannel {
 public:
  IngestBatchResponse Send(const IngestBatchRequest& request, std::chrono::milliseconds) override {
    batches.push_back(request);
    IngestBatchResponse response;
    response.set_committed_sequence(request.chunks(request.chunks_size() - 1).sequence());
    return response;
  }

  std::vector<IngestBatchRequest> batches;
};

// Accepts the registration with a fixed committed point, then ends the call.
class AcceptingStream final : public ControlStream {
 public:
  explicit AcceptingStream(uint64_t committed) : committed_(committed) {}

  bool Write(const SensorMessage&) override {
    return true;
  }
  bool Read(ServerMessage* message) override {
    if (delivered_) return false;
    delivered_ = true;
    message->mutable_accepted()->set_session_id("session-1");
    message->mutable_accepted()->set_committed_sequence(committed_);
    return true;
  }
  void Finish() override {}
  void Cancel() override {}

 private:
  uint64_t committed_;
  bool     delivered_ = false;
};

class AcceptingConnector final : public ControlConnector {
 public:
  explicit AcceptingConnector(uint64_t committed) : committed_(committed) {}

  std::unique_ptr<ControlStream> Open(const std::string&, const std::string&) override {
    return std::make_unique<AcceptingStream>(committed_);
  }

 private:
  uint64_t committed_;
};

struct Harness {
  explicit Harness(uint64_t collector_committed = 0, std::unique_ptr<SpoolSource> spool = nullptr) {
    SensorAgentOptions options;
    options.sensor_id        = "sensor-a";
    options.software_version = "2.0.0";
    options.max_chunk_bytes  = 4;
    options.clock_skew_ms    = -15;

    ControlChannelOptions control;
    control.token = "secret-a";

    agent = std::make_unique<SensorAgent>(options, queue, channel, std::make_shared<AcceptingConnector>(collector_committed), control,
                                          sensorlink::sensor::DispatcherOptions{}, std::move(spool));
  }

  std::shared_ptr<DurableQueue>     queue   = std::make_shared<DurableQueue>(std::make_shared<sensorlink::db::memory::MemoryQueueRepository>());
  std::shared_ptr<CommitAllChannel> channel = std::make_shared<CommitAllChannel>();
  std::unique_ptr<SensorAgent>      agent;
};

void TestSubmitSplitsIntoQueue() {
  Harness h;

  const auto event_id = h.agent->Submit("abcdefghij", 1234, {{"unit", "celsius"}});
  assert(!event_id.empty());
  assert(h.queue->QueueDepth() == 3);

  const auto chunks = h.queue->PeekRange(0, 10, 0);
  assert(chunks[0].sensor_id() == "sensor-a");
  assert(chunks[0].event_id() == event_id);
  assert(chunks[0].chunk_count() == 3);
  assert(sensorlink::codec::DecodePayload(chunks[2]) == "ij");
  assert(chunks[1].logical_timestamp_ms() == 1234);
  assert(chunks[1].clock_skew_ms() == -15);
  assert(chunks[1].attributes().at("unit") == "celsius");
  assert(sensorlink::codec::Assemble(chunks) == "abcdefghij");
}

void TestHeartbeatReportsQueueState() {
  Harness h;
  h.agent->Submit("abcdefgh");

  auto heartbeat = h.agent->BuildHeartbeat();
  assert(heartbeat.software_version() == "2.0.0");
  assert(heartbeat.queue_depth() == 2);
  assert(heartbeat.last_committed_sequence() == 0);
  assert(heartbeat.clock_skew_ms() == -15);

  ChunkRequest request;
  request.set_window_id("w-1");
  h.agent->Dispatch().ProcessRequest(request);

  heartbeat = h.agent->BuildHeartbeat();
  assert(heartbeat.queue_depth() == 0);
  assert(heartbeat.last_committed_sequence() == 2);
  assert(heartbeat.oldest_pending_age_ms() == 0);
}

void TestRegistrationDropsCommittedEntries() {
  Harness h(3);
  h.agent->Submit("abcdefghijkl");
  h.agent->Submit("mn");
  assert(h.queue->QueueDepth() == 4);

  assert(h.agent->Control().RunOnce());
  assert(h.queue->QueueDepth() == 1);
  assert(h.queue->LastAckedSequence() == 3);
  assert(sensorlink::codec::DecodePayload(h.queue->PeekRange(3, 10, 0).front()) == "mn");
}

void TestRegistrationRaisesSequenceFloor() {
  // a wiped queue must not reuse sequences the collector already committed
  Harness h(40);
  assert(h.agent->Control().RunOnce());

  h.agent->Submit("ab");
  assert(h.queue->PeekRange(0, 10, 0).front().sequence() == 41);
}

void TestMaintenanceDrainsSpoolAndProbes() {
  const auto dir = std::filesystem::temp_directory_path() / "sensorlink_sensor_agent_spool";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  std::ofstream(dir / "b.json") << "second";
  std::ofstream(dir / "a.json") << "first";
  std::ofstream(dir / ".c.json") << "partial";
  std::ofstream(dir / "d.txt") << "ignored";

  Harness h(0, std::make_unique<SpoolSource>(SpoolOptions{dir.string(), ".json"}));
  h.agent->RunMaintenance();

  assert(!std::filesystem::exists(dir / "a.json"));
  assert(!std::filesystem::exists(dir / "b.json"));
  assert(std::filesystem::exists(dir / ".c.json"));
  assert(std::filesystem::exists(dir / "d.txt"));

  const auto chunks = h.queue->PeekRange(0, 10, 0);
  assert(chunks.size() == 4);
  assert(chunks[0].attributes().at("source_file") == "a.json");
  assert(sensorlink::codec::DecodePayload(chunks[0]) == "firs");
  assert(chunks[2].attributes().at("source_file") == "b.json");

  // the probe queued a window for the worker
  assert(h.agent->Dispatch().State() == sensorlink::sensor::DispatcherState::AwaitingRequest);

  std::filesystem::remove_all(dir);
}

void TestOversizedChunkLimitIsRejected() {
  SensorAgentOptions options;
  options.sensor_id       = "sensor-a";
  options.max_chunk_bytes = 0;

  auto queue = std::make_shared<DurableQueue>(std::make_shared<sensorlink::db::memory::MemoryQueueRepository>());
  SensorAgent agent(options, queue, std::make_shared<CommitAllChannel>(), std::make_shared<AcceptingConnector>(0), {});

  bool threw = false;
  try {
    agent.Submit("abc");
  } catch (const sensorlink::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(queue->QueueDepth() == 0);
}

} // namespace

int main() {
  TestSubmitSplitsIntoQueue();
  TestHeartbeatReportsQueueState();
  TestRegistrationDropsCommittedEntries();
  TestRegistrationRaisesSequenceFloor();
  TestMaintenanceDrainsSpoolAndProbes();
  TestOversizedChunkLimitIsRejected();

  std::cout << "sensorlink_unit_sensor_agent: pass\n";
  return 0;
}
