#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/chunk_repository.hpp"
#include "internal/db/api/queue_repository.hpp"
#include "internal/db/memory/memory_chunk_repository.hpp"
#include "internal/db/memory/memory_queue_repository.hpp"

#if SENSORLINK_DB_SQLITE
#include "internal/db/sqlite/sqlite_chunk_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_queue_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using sensorlink::db::ChunkRepository;
using sensorlink::db::ErrorCode;
using sensorlink::db::QueueRepository;
using sensorlink::db::model::ChunkRecord;
using sensorlink::db::model::EventRecord;
using sensorlink::db::model::EventState;
using sensorlink::db::model::QueueEntryRecord;
using sensorlink::db::model::QueueStateRecord;
using sensorlink::db::model::SensorOffsetRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                      name;
  std::function<std::shared_ptr<ChunkRepository>()> make_chunk_repository;
  std::function<std::shared_ptr<QueueRepository>()> make_queue_repository;
  std::function<bool()>                            supports_restart;
  std::function<void()>                            cleanup;
};

std::string BinaryPayload(char tag, uint64_t sequence) {
  std::string payload(1, tag);
  payload.push_back('\0');
  payload += std::to_string(sequence);
  return payload;
}

ChunkRecord MakeChunk(const std::string& sensor_id, uint64_t sequence, const std::string& event_id, uint32_t index, uint32_t count) {
  // embedded NUL bytes must survive the blob columns
  return ChunkRecord{.sensor_id      = sensor_id,
                     .sequence       = sequence,
                     .event_id       = event_id,
                     .chunk_index    = index,
                     .chunk_count    = count,
                     .payload        = BinaryPayload('p', sequence),
                     .chunk_sha256   = std::string(32, '\0'),
                     .compression    = sequence % 2 == 1 ? "gzip" : "",
                     .received_at_ms = 1000 + sequence};
}

EventRecord MakeEvent(const std::string& sensor_id, const std::string& event_id, uint64_t first, uint64_t last, EventState state,
                      uint64_t updated_at_ms) {
  return EventRecord{.sensor_id       = sensor_id,
                     .event_id        = event_id,
                     .chunk_count     = static_cast<uint32_t>(last - first + 1),
                     .total_bytes     = 64,
                     .event_sha256    = std::string(32, '\x7f'),
                     .created_at_ms   = 500,
                     .logical_timestamp_ms = -20,
                     .clock_skew_ms   = 3,
                     .attributes      = R"({"unit":"dBm"})",
                     .state           = state,
                     .received_chunks = static_cast<uint32_t>(last - first + 1),
                     .first_sequence  = first,
                     .last_sequence   = last,
                     .payload         = state == EventState::Complete ? "payload-" + event_id : "",
                     .completed_at_ms = state == EventState::Complete ? updated_at_ms : 0,
                     .updated_at_ms   = updated_at_ms};
}

void VerifyChunkInsertAndDuplicate(ChunkRepository& repo, const std::string& sensor_id) {
  auto tx = repo.Begin();
  for (uint64_t sequence : {1, 2, 3, 5}) {
    auto inserted = repo.InsertChunk(*tx, MakeChunk(sensor_id, sequence, "e-" + std::to_string(sequence), 0, 1));
    assert(inserted);
  }

  auto duplicate = repo.InsertChunk(*tx, MakeChunk(sensor_id, 2, "other", 0, 1));
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::ConstraintViolation);

  auto chunk = repo.GetChunk(*tx, sensor_id, 5);
  assert(chunk.has_value());
  assert(chunk->event_id == "e-5");
  assert(chunk->payload == MakeChunk(sensor_id, 5, "e-5", 0, 1).payload);
  assert(chunk->chunk_sha256.size() == 32);
  assert(chunk->compression == "gzip");
  assert(repo.GetChunk(*tx, sensor_id, 2)->compression.empty());
  assert(!repo.GetChunk(*tx, sensor_id, 4).has_value());
  assert(!repo.GetChunk(*tx, sensor_id + "-other", 1).has_value());

  auto sequences = repo.ListSequencesAfter(*tx, sensor_id, 1, 2);
  assert((sequences == std::vector<uint64_t>{2, 3}));
  sequences = repo.ListSequencesAfter(*tx, sensor_id, 3, 10);
  assert((sequences == std::vector<uint64_t>{5}));
  tx->Commit();
}

void VerifyEventLifecycle(ChunkRepository& repo, const std::string& sensor_id) {
  {
    auto tx = repo.Begin();
    for (uint64_t sequence = 1; sequence <= 4; ++sequence) {
      auto inserted = repo.InsertChunk(*tx, MakeChunk(sensor_id, sequence, sequence <= 2 ? "old" : "new", (sequence - 1) % 2, 2));
      assert(inserted);
    }
    assert(repo.UpsertEvent(*tx, MakeEvent(sensor_id, "old", 1, 2, EventState::Complete, 100)));
    assert(repo.UpsertEvent(*tx, MakeEvent(sensor_id, "new", 3, 4, EventState::Pending, 200)));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    auto chunks = repo.ListEventChunks(*tx, sensor_id, "new");
    assert(chunks.size() == 2);

    auto event = repo.GetEvent(*tx, sensor_id, "old");
    assert(event.has_value());
    assert(event->state == EventState::Complete);
    assert(event->payload == "payload-old");
    assert(event->attributes == R"({"unit":"dBm"})");
    assert(event->logical_timestamp_ms == -20);
    assert(event->event_sha256 == std::string(32, '\x7f'));

    auto latest = repo.ListLatestCompleteEvents(*tx);
    auto it     = std::find_if(latest.begin(), latest.end(), [&](const EventRecord& e) { return e.sensor_id == sensor_id; });
    assert(it != latest.end() && it->event_id == "old");

    assert(repo.UpsertEvent(*tx, MakeEvent(sensor_id, "new", 3, 4, EventState::Complete, 300)));
    latest = repo.ListLatestCompleteEvents(*tx);
    it     = std::find_if(latest.begin(), latest.end(), [&](const EventRecord& e) { return e.sensor_id == sensor_id; });
    assert(it != latest.end() && it->event_id == "new");

    auto stale = repo.ListEventsUpdatedBefore(*tx, 250);
    assert(std::count_if(stale.begin(), stale.end(), [&](const EventRecord& e) { return e.sensor_id == sensor_id; }) == 1);
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.DeleteEventChunksAbove(*tx, sensor_id, "new", 3));
    assert(repo.ListEventChunks(*tx, sensor_id, "new").size() == 1);

    assert(repo.DeleteEvent(*tx, sensor_id, "old"));
    assert(!repo.GetEvent(*tx, sensor_id, "old").has_value());
    assert(repo.ListEventChunks(*tx, sensor_id, "old").empty());
    assert(!repo.GetChunk(*tx, sensor_id, 1).has_value());
    tx->Commit();
  }
}

void VerifyOffsets(ChunkRepository& repo, const std::string& sensor_id) {
  auto tx = repo.Begin();
  assert(!repo.GetOffset(*tx, sensor_id).has_value());

  SensorOffsetRecord offset{.sensor_id = sensor_id, .committed_sequence = 7, .expired_upto = 0, .updated_at_ms = NowMs()};
  assert(repo.UpsertOffset(*tx, offset));
  offset.committed_sequence = 9;
  offset.expired_upto       = 4;
  assert(repo.UpsertOffset(*tx, offset));

  auto read = repo.GetOffset(*tx, sensor_id);
  assert(read.has_value());
  assert(read->committed_sequence == 9);
  assert(read->expired_upto == 4);

  auto all = repo.ListOffsets(*tx);
  assert(std::count_if(all.begin(), all.end(), [&](const SensorOffsetRecord& r) { return r.sensor_id == sensor_id; }) == 1);
  tx->Commit();
}

void VerifyChunkRollback(ChunkRepository& repo, const std::string& sensor_id) {
  {
    auto tx       = repo.Begin();
    auto inserted = repo.InsertChunk(*tx, MakeChunk(sensor_id, 1, "e", 0, 1));
    assert(inserted);
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.UpsertOffset(*tx, SensorOffsetRecord{.sensor_id = sensor_id, .committed_sequence = 1}));
  }
  auto tx = repo.Begin();
  assert(!repo.GetChunk(*tx, sensor_id, 1).has_value());
  assert(!repo.GetOffset(*tx, sensor_id).has_value());
  tx->Commit();
}

void VerifyQueue(QueueRepository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.CountEntries(*tx) == 0);
    assert(!repo.OldestEnqueuedAt(*tx).has_value());

    std::vector<QueueEntryRecord> entries;
    for (uint64_t sequence = 1; sequence <= 5; ++sequence) {
      entries.push_back(QueueEntryRecord{.sequence       = sequence,
                                         .event_id       = "e",
                                         .chunk_index    = static_cast<uint32_t>(sequence - 1),
                                         .chunk_count    = 5,
                                         .payload_bytes  = 10,
                                         .chunk          = BinaryPayload('c', sequence),
                                         .enqueued_at_ms = 1000 * sequence});
    }
    assert(repo.InsertEntries(*tx, entries));
    assert(repo.PutState(*tx, QueueStateRecord{.last_sequence = 5, .acked_upto = 0, .expired_upto = 0}));
    tx->Commit();
  }
  {
    auto tx   = repo.Begin();
    auto page = repo.ReadEntriesAfter(*tx, 1, 2);
    assert(page.size() == 2);
    assert(page[0].sequence == 2 && page[1].sequence == 3);
    assert(page[0].chunk.size() == 3);
    assert(repo.OldestEnqueuedAt(*tx).value() == 1000);

    assert(repo.RecordAttempt(*tx, {2, 3}, 7777));
    page = repo.ReadEntriesAfter(*tx, 1, 1);
    assert(page[0].attempt_count == 1);
    assert(page[0].last_attempt_at_ms == 7777);

    uint64_t deleted = 0;
    assert(repo.DeleteEntriesUpTo(*tx, 2, deleted));
    assert(deleted == 2);

    uint64_t max_sequence = 0;
    assert(repo.DeleteEntriesOlderThan(*tx, 4000, deleted, max_sequence));
    assert(deleted == 1);
    assert(max_sequence == 3);
    assert(repo.CountEntries(*tx) == 2);
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.PutState(*tx, QueueStateRecord{.last_sequence = 5, .acked_upto = 2, .expired_upto = 3}));
    tx->Rollback();
  }
  auto tx    = repo.Begin();
  auto state = repo.GetState(*tx);
  assert(state.last_sequence == 5);
  assert(state.acked_upto == 0);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }
  {
    auto chunks = backend.make_chunk_repository();
    auto tx     = chunks->Begin();
    assert(chunks->InsertChunk(*tx, MakeChunk("durable", 1, "e", 0, 1)));
    assert(chunks->UpsertOffset(*tx, SensorOffsetRecord{.sensor_id = "durable", .committed_sequence = 1, .updated_at_ms = NowMs()}));
    tx->Commit();

    auto queue = backend.make_queue_repository();
    auto qtx   = queue->Begin();
    assert(queue->PutState(*qtx, QueueStateRecord{.last_sequence = 42, .acked_upto = 40, .expired_upto = 0}));
    qtx->Commit();
  }

  auto chunks = backend.make_chunk_repository();
  auto tx     = chunks->Begin();
  assert(chunks->GetChunk(*tx, "durable", 1).has_value());
  assert(chunks->GetOffset(*tx, "durable")->committed_sequence == 1);
  tx->Commit();

  auto queue = backend.make_queue_repository();
  auto qtx   = queue->Begin();
  assert(queue->GetState(*qtx).last_sequence == 42);
  qtx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                  = "memory",
      .make_chunk_repository = []() { return std::make_shared<sensorlink::db::memory::MemoryChunkRepository>(); },
      .make_queue_repository = []() { return std::make_shared<sensorlink::db::memory::MemoryQueueRepository>(); },
      .supports_restart      = []() { return false; },
      .cleanup               = []() {},
  };
}

#if SENSORLINK_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto stamp      = std::to_string(NowMs());
  const auto store_path = (std::filesystem::temp_directory_path() / ("sensorlink_integration_store_" + stamp + ".db")).string();
  const auto queue_path = (std::filesystem::temp_directory_path() / ("sensorlink_integration_queue_" + stamp + ".db")).string();

  return BackendFactory{
      .name = "sqlite",
      .make_chunk_repository =
          [store_path]() {
            auto db = std::make_shared<sensorlink::db::sqlite::SqliteDB>(store_path, true);
            sensorlink::db::sqlite::BootstrapChunkStoreSchema(db);
            return std::make_shared<sensorlink::db::sqlite::SqliteChunkRepository>(std::move(db));
          },
      .make_queue_repository =
          [queue_path]() {
            auto db = std::make_shared<sensorlink::db::sqlite::SqliteDB>(queue_path, true);
            sensorlink::db::sqlite::BootstrapQueueSchema(db);
            return std::make_shared<sensorlink::db::sqlite::SqliteQueueRepository>(std::move(db));
          },
      .supports_restart = []() { return true; },
      .cleanup =
          [store_path, queue_path]() {
            for (const auto& path : {store_path, queue_path}) {
              for (const auto* suffix : {"", "-wal", "-shm"}) {
                std::filesystem::remove(path + suffix);
              }
            }
          },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  auto chunks = backend.make_chunk_repository();
  VerifyChunkInsertAndDuplicate(*chunks, backend.name + "-chunks");
  VerifyEventLifecycle(*chunks, backend.name + "-events");
  VerifyOffsets(*chunks, backend.name + "-offsets");
  VerifyChunkRollback(*chunks, backend.name + "-rollback");

  auto queue = backend.make_queue_repository();
  VerifyQueue(*queue);

  chunks.reset();
  queue.reset();
  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if SENSORLINK_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "sensorlink_integration_repository_parity: pass\n";
  return 0;
}
