#include "internal/service/ingest_service.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/auth/sensor_registry.hpp"
#include "internal/codec/chunk_codec.hpp"
#include "internal/control/session_registry.hpp"
#include "internal/db/memory/memory_chunk_repository.hpp"
#include "internal/service/request_scheduler.hpp"
#include "internal/snapshot/snapshot_cache.hpp"
#include "internal/store/chunk_store.hpp"
#include "internal/store/offset_tracker.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sensorlink::pipeline::v1;
using sensorlink::service::IngestLimits;
using sensorlink::service::IngestService;
using sensorlink::service::ServiceContext;

class RecordingSession final : public sensorlink::control::ControlSession {
 public:
  using ControlSession::ControlSession;

  std::vector<ServerMessage> sent;

 protected:
  bool Write(const ServerMessage& message) override {
    sent.push_back(message);
    return true;
  }
  void Cancel() override {}
};

struct Collector {
  explicit Collector(IngestLimits limits = {}) {
    auto repo       = std::make_shared<sensorlink::db::memory::MemoryChunkRepository>();
    ctx.offsets     = std::make_shared<sensorlink::store::OffsetTracker>(repo);
    ctx.snapshots   = std::make_shared<sensorlink::snapshot::SnapshotCache>();
    ctx.chunk_store = std::make_shared<sensorlink::store::ChunkStore>(repo, ctx.offsets, ctx.snapshots);
    ctx.sensors     = std::make_shared<sensorlink::auth::SensorRegistry>();
    ctx.sessions    = std::make_shared<sensorlink::control::SessionRegistry>();
    ctx.scheduler   = std::make_shared<sensorlink::service::RequestScheduler>(ctx.sessions, ctx.offsets);
    ctx.sensors->Upsert("s1", "token-1");
    ingest = std::make_shared<IngestService>(ctx, limits);
  }

  ServiceContext                 ctx;
  std::shared_ptr<IngestService> ingest;
};

IngestBatchRequest MakeBatch(const std::string& payload, std::size_t chunk_bytes, uint64_t first_sequence, const std::string& window_id = "w-1") {
  sensorlink::codec::EventOptions event;
  event.sensor_id   = "s1";
  event.compression = sensorlink::codec::Compression::None;

  IngestBatchRequest batch;
  batch.set_sensor_id("s1");
  batch.set_window_id(window_id);
  for (auto& chunk : sensorlink::codec::Split(payload, chunk_bytes, event)) {
    chunk.set_sequence(first_sequence++);
    *batch.add_chunks() = std::move(chunk);
  }
  return batch;
}

template <typename Error>
bool Rejects(Collector& c, const IngestBatchRequest& batch, const std::string& token = "token-1") {
  try {
    c.ingest->IngestBatch(token, batch);
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestBatchIsStoredAndCommitted() {
  Collector  c;
  const auto response = c.ingest->IngestBatch("token-1", MakeBatch("0123456789", 4, 1));

  assert(response.window_id() == "w-1");
  assert(response.accepted_size() == 3);
  assert(response.duplicates_size() == 0);
  assert(response.errors_size() == 0);
  assert(response.committed_sequence() == 3);
  assert(response.received_sequence() == 3);
  assert(c.ctx.snapshots->Get("s1")->payload() == "0123456789");
}

void TestGzipBatchIsInflatedIntoSnapshot() {
  Collector c;

  sensorlink::codec::EventOptions event;
  event.sensor_id = "s1";
  const std::string payload(6000, 'g');

  IngestBatchRequest batch;
  batch.set_sensor_id("s1");
  batch.set_window_id("w-gzip");
  uint64_t sequence = 1;
  for (auto& chunk : sensorlink::codec::Split(payload, 2000, event)) {
    assert(chunk.compression() == "gzip");
    chunk.set_sequence(sequence++);
    *batch.add_chunks() = std::move(chunk);
  }

  const auto response = c.ingest->IngestBatch("token-1", batch);
  assert(response.accepted_size() == 3);
  assert(response.committed_sequence() == 3);
  assert(c.ctx.snapshots->Get("s1")->payload() == payload);
}

void TestResentBatchReportsDuplicates() {
  Collector  c;
  const auto batch = MakeBatch("abcdef", 3, 1);
  c.ingest->IngestBatch("token-1", batch);

  const auto response = c.ingest->IngestBatch("token-1", batch);
  assert(response.accepted_size() == 0);
  assert(response.duplicates_size() == 2);
  assert(response.committed_sequence() == 2);
}

void TestCorruptChunkReportedOthersStored() {
  Collector c;
  auto      batch = MakeBatch("abcdefghi", 3, 1);
  batch.mutable_chunks(1)->set_payload("XXX");

  const auto response = c.ingest->IngestBatch("token-1", batch);
  assert(response.accepted_size() == 2);
  assert(response.errors_size() == 1);
  assert(response.errors(0).sequence() == 2);
  assert(response.errors(0).reason() == "chunk hash mismatch");
  // chunk 1 is stored but its event is still open
  assert(response.committed_sequence() == 0);
  assert(response.received_sequence() == 1);
}

void TestSessionReceivesAck() {
  Collector c;
  auto      session = std::make_shared<RecordingSession>("s1", "session-1");
  c.ctx.sessions->Insert(session);
  session->SetOutstandingWindow({"w-7", 0, sensorlink::util::Now()});

  c.ingest->IngestBatch("token-1", MakeBatch("abc", 3, 1, "w-7"));

  assert(session->sent.size() == 1);
  assert(session->sent[0].ack().window_id() == "w-7");
  assert(session->sent[0].ack().committed_upto_sequence() == 1);
  assert(!session->Outstanding().has_value());
}

void TestCredentialIsChecked() {
  Collector c;
  assert(Rejects<sensorlink::util::UnauthorizedSensor>(c, MakeBatch("abc", 3, 1), "wrong"));
  assert(Rejects<sensorlink::util::UnauthorizedSensor>(c, MakeBatch("abc", 3, 1), ""));
  assert(c.ctx.offsets->SinceSequence("s1") == 0);
}

void TestMalformedBatchesAreRejectedWhole() {
  Collector c;

  auto batch = MakeBatch("abc", 3, 1);
  batch.clear_sensor_id();
  assert(Rejects<sensorlink::util::InvalidArgument>(c, batch));

  batch = MakeBatch("abc", 3, 0);
  assert(Rejects<sensorlink::util::InvalidArgument>(c, batch));

  batch = MakeBatch("abcdef", 3, 1);
  batch.mutable_chunks(1)->set_sequence(1);
  assert(Rejects<sensorlink::util::InvalidArgument>(c, batch));

  batch = MakeBatch("abc", 3, 1);
  batch.mutable_chunks(0)->set_sensor_id("s2");
  assert(Rejects<sensorlink::util::InvalidArgument>(c, batch));

  batch = MakeBatch("abc", 3, 1);
  batch.mutable_chunks(0)->set_chunk_index(1);
  assert(Rejects<sensorlink::util::InvalidArgument>(c, batch));

  batch = MakeBatch("abc", 3, 1);
  batch.mutable_chunks(0)->set_chunk_sha256("short");
  assert(Rejects<sensorlink::util::InvalidArgument>(c, batch));

  batch = MakeBatch("abc", 3, 1);
  batch.mutable_chunks(0)->clear_event_id();
  assert(Rejects<sensorlink::util::InvalidArgument>(c, batch));

  batch = MakeBatch("abc", 3, 1);
  batch.mutable_chunks(0)->set_compression("zstd");
  assert(Rejects<sensorlink::util::InvalidArgument>(c, batch));

  // nothing from the rejected batches was stored
  const auto response = c.ingest->IngestBatch("token-1", MakeBatch("abc", 3, 1));
  assert(response.accepted_size() == 1);
}

void TestBatchLimits() {
  IngestLimits limits;
  limits.max_batch_chunks = 2;
  limits.max_batch_bytes  = 5;
  Collector c(limits);

  assert(Rejects<sensorlink::util::InvalidArgument>(c, MakeBatch("abc", 1, 1)));
  assert(Rejects<sensorlink::util::InvalidArgument>(c, MakeBatch("abcdef", 3, 1)));
  assert(c.ingest->IngestBatch("token-1", MakeBatch("abcd", 2, 1)).committed_sequence() == 2);
}

void TestRequireSession() {
  IngestLimits limits;
  limits.require_session = true;
  Collector c(limits);

  assert(Rejects<sensorlink::util::InvalidState>(c, MakeBatch("abc", 3, 1)));

  c.ctx.sessions->Insert(std::make_shared<RecordingSession>("s1", "session-1"));
  assert(c.ingest->IngestBatch("token-1", MakeBatch("abc", 3, 1)).committed_sequence() == 1);
}

} // namespace

int main() {
  TestBatchIsStoredAndCommitted();
  TestGzipBatchIsInflatedIntoSnapshot();
  TestResentBatchReportsDuplicates();
  TestCorruptChunkReportedOthersStored();
  TestSessionReceivesAck();
  TestCredentialIsChecked();
  TestMalformedBatchesAreRejectedWhole();
  TestBatchLimits();
  TestRequireSession();

  std::cout << "sensorlink_unit_ingest_service: pass\n";
  return 0;
}
