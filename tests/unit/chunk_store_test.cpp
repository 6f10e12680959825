#include "internal/store/chunk_store.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/codec/chunk_codec.hpp"
#include "internal/db/memory/memory_chunk_repository.hpp"
#include "internal/snapshot/snapshot_cache.hpp"
#include "internal/store/offset_tracker.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using sensorlink::pipeline::v1::Chunk;
using sensorlink::store::ChunkStore;
using sensorlink::store::OffsetTracker;
using sensorlink::store::WriteOutcome;

struct Harness {
  explicit Harness(sensorlink::store::ChunkStoreOptions options = {})
      : repo(std::make_shared<sensorlink::db::memory::MemoryChunkRepository>()),
        offsets(std::make_shared<OffsetTracker>(repo)),
        cache(std::make_shared<sensorlink::snapshot::SnapshotCache>()),
        store(std::make_shared<ChunkStore>(repo, offsets, cache, options)) {}

  std::shared_ptr<sensorlink::db::memory::MemoryChunkRepository> repo;
  std::shared_ptr<OffsetTracker>                                 offsets;
  std::shared_ptr<sensorlink::snapshot::SnapshotCache>           cache;
  std::shared_ptr<ChunkStore>                                    store;
};

// Splits payload into chunk_bytes pieces numbered from first_sequence.
std::vector<Chunk> MakeEvent(const std::string& payload, std::size_t chunk_bytes, uint64_t first_sequence, const std::string& sensor_id = "s1") {
  sensorlink::codec::EventOptions options;
  options.sensor_id            = sensor_id;
  options.logical_timestamp_ms = 500;
  options.attributes           = {{"kind", "spectrum"}};
  auto chunks                  = sensorlink::codec::Split(payload, chunk_bytes, options);
  for (auto& chunk : chunks) {
    chunk.set_sequence(first_sequence++);
  }
  return chunks;
}

void TestCompleteEventPublishesSnapshot() {
  Harness    h;
  const auto chunks = MakeEvent("hello world!", 4, 1);

  const auto batch = h.store->WriteBatch("s1", chunks);
  assert(batch.committed_sequence == 3);
  assert(batch.results.size() == 3);
  for (const auto& result : batch.results) {
    assert(result.outcome == WriteOutcome::Accepted);
  }
  assert(!batch.results[1].completed.has_value());
  assert(batch.results[2].completed.has_value());

  const auto snapshot = h.cache->Get("s1");
  assert(snapshot.has_value());
  assert(snapshot->payload() == "hello world!");
  assert(snapshot->event_id() == chunks[0].event_id());
  assert(snapshot->last_sequence() == 3);
  assert(snapshot->chunk_count() == 3);
  assert(snapshot->logical_timestamp_ms() == 500);
  assert(snapshot->attributes().at("kind") == "spectrum");
  assert(h.store->CommittedSequence("s1") == 3);

  const auto event = h.store->GetEvent("s1", chunks[0].event_id());
  assert(event.has_value());
  assert(event->state == sensorlink::db::model::EventState::Complete);
  assert(event->received_chunks == 3);
}

void TestCommittedWaitsForGap() {
  Harness    h;
  const auto chunks = MakeEvent("abcdefghi", 3, 10);
  // nine single-chunk events fill 1..9
  const auto head = MakeEvent("0123456789", 1, 1);
  h.store->WriteBatch("s1", std::vector<Chunk>(head.begin(), head.begin() + 9));
  assert(h.store->CommittedSequence("s1") == 9);

  auto batch = h.store->WriteBatch("s1", {chunks[0]});
  assert(batch.committed_sequence == 9);
  assert(batch.received_sequence == 10);

  batch = h.store->WriteBatch("s1", {chunks[2]});
  assert(batch.results[0].outcome == WriteOutcome::Accepted);
  assert(batch.committed_sequence == 9);
  assert(batch.received_sequence == 10);
  assert(h.store->CommittedSequence("s1") == 9);
  assert(h.cache->Get("s1")->payload() == "8");

  // the collector asks again from 9 and gets 10, 11 and 12
  batch = h.store->WriteBatch("s1", chunks);
  assert(batch.results[0].outcome == WriteOutcome::DuplicateIgnored);
  assert(batch.results[1].outcome == WriteOutcome::Accepted);
  assert(batch.results[2].outcome == WriteOutcome::DuplicateIgnored);
  assert(batch.results[1].completed.has_value());
  assert(batch.committed_sequence == 12);
  assert(batch.received_sequence == 12);
  assert(h.cache->Get("s1")->payload() == "abcdefghi");
}

void TestFailedEventSpanningWindowsIsResent() {
  Harness h;
  h.store->WriteBatch("s1", MakeEvent("head", 4, 1));
  assert(h.store->CommittedSequence("s1") == 1);

  auto chunks = MakeEvent("abcdefghi", 3, 2);
  for (auto& chunk : chunks) {
    chunk.set_event_sha256(std::string(32, '\x02'));
  }

  auto batch = h.store->WriteBatch("s1", {chunks[0], chunks[1]});
  assert(batch.committed_sequence == 1);
  assert(batch.received_sequence == 3);

  batch = h.store->WriteBatch("s1", {chunks[2]});
  assert(batch.results[0].outcome == WriteOutcome::IntegrityError);
  assert(batch.committed_sequence == 1);
  assert(batch.received_sequence == 1);

  // every chunk of the event is gone, so the resend is stored again
  const auto event = h.store->GetEvent("s1", chunks[0].event_id());
  assert(event->state == sensorlink::db::model::EventState::Failed);
  assert(event->received_chunks == 0);

  batch = h.store->WriteBatch("s1", {chunks[0], chunks[1]});
  assert(batch.results[0].outcome == WriteOutcome::Accepted);
  assert(batch.results[1].outcome == WriteOutcome::Accepted);
  assert(batch.committed_sequence == 1);
}

void TestDuplicatesAreIgnored() {
  Harness    h;
  const auto chunks = MakeEvent("abcdef", 3, 1);
  h.store->WriteBatch("s1", chunks);

  const auto again = h.store->WriteBatch("s1", chunks);
  for (const auto& result : again.results) {
    assert(result.outcome == WriteOutcome::DuplicateIgnored);
    assert(!result.completed.has_value());
  }
  assert(again.committed_sequence == 2);
}

void TestConflictingSequenceIsRejected() {
  Harness h;
  h.store->Write(MakeEvent("abc", 3, 1).front());

  const auto result = h.store->Write(MakeEvent("xyz", 3, 1).front());
  assert(result.outcome == WriteOutcome::IntegrityError);
  assert(h.store->CommittedSequence("s1") == 1);
}

void TestCorruptChunkIsNotStored() {
  Harness h;
  auto    chunk = MakeEvent("abc", 3, 1).front();
  chunk.set_payload("abd");

  const auto result = h.store->Write(chunk);
  assert(result.outcome == WriteOutcome::IntegrityError);
  assert(result.reason == "chunk hash mismatch");
  assert(result.committed_sequence == 0);

  // the sensor's retry with the right bytes is accepted
  const auto retry = h.store->Write(MakeEvent("abc", 3, 1).front());
  assert(retry.outcome == WriteOutcome::Accepted);
  assert(retry.committed_sequence == 1);
}

void TestForeignSensorChunkIsRefused() {
  Harness    h;
  const auto chunks = MakeEvent("abc", 3, 1, "s2");

  bool threw = false;
  try {
    h.store->WriteBatch("s1", chunks);
  } catch (const sensorlink::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(h.store->CommittedSequence("s1") == 0);
}

void TestEventHashFailureIsRetriedThenSkipped() {
  sensorlink::store::ChunkStoreOptions options;
  options.max_assembly_failures = 2;
  Harness h(options);

  auto chunks = MakeEvent("abcdef", 3, 1);
  for (auto& chunk : chunks) {
    chunk.set_event_sha256(std::string(32, '\x01'));
  }

  auto batch = h.store->WriteBatch("s1", chunks);
  assert(batch.results[1].outcome == WriteOutcome::IntegrityError);
  assert(batch.committed_sequence == 0);

  // second failure: chunks stay so the committed point can move on
  batch = h.store->WriteBatch("s1", chunks);
  assert(batch.results[0].outcome == WriteOutcome::Accepted);
  assert(batch.committed_sequence == 2);
  assert(!h.cache->Get("s1").has_value());

  const auto event = h.store->GetEvent("s1", chunks[0].event_id());
  assert(event->state == sensorlink::db::model::EventState::Abandoned);
  assert(event->assembly_failures == 2);
}

void TestExpiredRangeIsSkipped() {
  Harness    h;
  const auto chunks = MakeEvent("abcdef", 3, 5);
  h.store->WriteBatch("s1", chunks);
  assert(h.store->CommittedSequence("s1") == 0);

  assert(h.store->ApplyExpired("s1", 4) == 6);
  assert(h.store->CommittedSequence("s1") == 6);

  // chunks below the skipped point are treated as already committed
  const auto late = h.store->Write(MakeEvent("zz", 2, 3).front());
  assert(late.outcome == WriteOutcome::DuplicateIgnored);
}

void TestOlderEventNeverHidesNewerSnapshot() {
  Harness    h;
  const auto older = MakeEvent("old!", 2, 1);
  const auto newer = MakeEvent("new!", 2, 3);

  h.store->WriteBatch("s1", newer);
  assert(h.cache->Get("s1")->payload() == "new!");

  const auto batch = h.store->WriteBatch("s1", older);
  assert(batch.committed_sequence == 4);
  assert(batch.results[1].completed.has_value());
  assert(h.cache->Get("s1")->payload() == "new!");
}

void TestRetentionKeepsLatestEvent() {
  Harness    h;
  const auto first  = MakeEvent("one", 3, 1);
  const auto second = MakeEvent("two", 3, 2);
  h.store->WriteBatch("s1", first);
  h.store->WriteBatch("s1", second);

  std::this_thread::sleep_for(20ms);
  assert(h.store->PruneRetention(1h) == 0);
  assert(h.store->PruneRetention(5ms) == 1);

  assert(!h.store->GetEvent("s1", first[0].event_id()).has_value());
  assert(h.store->GetEvent("s1", second[0].event_id()).has_value());
  assert(h.store->CommittedSequence("s1") == 2);

  // a pruned sequence sent again is not stored twice
  const auto resent = h.store->Write(first[0]);
  assert(resent.outcome == WriteOutcome::DuplicateIgnored);
}

void TestOverlappingBatchesFromOneSensor() {
  Harness h;

  constexpr uint64_t kEvents = 20;
  std::vector<Chunk> all;
  for (uint64_t i = 0; i < kEvents; ++i) {
    const auto event = MakeEvent("event-" + std::to_string(100 + i), 4, 1 + i * 3);
    assert(event.size() == 3);
    all.insert(all.end(), event.begin(), event.end());
  }

  std::mutex               completed_mu;
  std::vector<std::string> completed;
  auto                     feed = h.cache->Subscribe();

  // each writer covers the whole range with windows of its own width and
  // starting offset, so windows overlap and most chunks arrive several times
  std::vector<std::thread> writers;
  for (std::size_t writer = 0; writer < 4; ++writer) {
    writers.emplace_back([&, writer] {
      const std::size_t width = 3 + writer * 2;
      for (std::size_t start = writer; start < all.size() + width; start += width) {
        const std::size_t from = start >= width ? start - width : 0;
        const std::size_t to   = std::min(start + 1, all.size());
        if (from >= to) continue;

        const auto batch = h.store->WriteBatch("s1", std::vector<Chunk>(all.begin() + from, all.begin() + to));
        std::lock_guard lock(completed_mu);
        for (const auto& result : batch.results) {
          assert(result.outcome != WriteOutcome::IntegrityError);
          if (result.completed.has_value()) {
            completed.push_back(result.completed->event_id());
          }
        }
      }
      // the tail once more, as a retry would send it
      h.store->WriteBatch("s1", std::vector<Chunk>(all.end() - 3, all.end()));
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  assert(h.store->CommittedSequence("s1") == kEvents * 3);

  auto       tx        = h.repo->Begin();
  const auto sequences = h.repo->ListSequencesAfter(*tx, "s1", 0, 1000);
  tx->Commit();
  assert(sequences.size() == kEvents * 3);
  for (std::size_t i = 0; i < sequences.size(); ++i) {
    assert(sequences[i] == i + 1);
  }

  std::sort(completed.begin(), completed.end());
  assert(completed.size() == kEvents);
  assert(std::adjacent_find(completed.begin(), completed.end()) == completed.end());
  assert(h.cache->Get("s1")->last_sequence() == kEvents * 3);

  // no event is broadcast twice; stale out-of-order completions are not broadcast at all
  std::vector<std::string> broadcast;
  while (auto update = feed->Next(10ms)) {
    if (update->type() == "snapshot") broadcast.push_back(update->snapshot().event_id());
  }
  assert(!broadcast.empty());
  assert(broadcast.size() <= kEvents);
  std::sort(broadcast.begin(), broadcast.end());
  assert(std::adjacent_find(broadcast.begin(), broadcast.end()) == broadcast.end());
}

void TestHydrateRestoresCache() {
  Harness h;
  h.store->WriteBatch("s1", MakeEvent("alpha", 5, 1));
  h.store->WriteBatch("s2", MakeEvent("beta", 5, 1, "s2"));

  auto       cache = std::make_shared<sensorlink::snapshot::SnapshotCache>();
  ChunkStore restarted(h.repo, h.offsets, cache);
  assert(restarted.Hydrate() == 2);
  assert(cache->Get("s1")->payload() == "alpha");
  assert(cache->Get("s2")->payload() == "beta");
  assert(cache->Get("s2")->attributes().at("kind") == "spectrum");
}

} // namespace

int main() {
  TestCompleteEventPublishesSnapshot();
  TestCommittedWaitsForGap();
  TestFailedEventSpanningWindowsIsResent();
  TestDuplicatesAreIgnored();
  TestConflictingSequenceIsRejected();
  TestCorruptChunkIsNotStored();
  TestForeignSensorChunkIsRefused();
  TestEventHashFailureIsRetriedThenSkipped();
  TestExpiredRangeIsSkipped();
  TestOlderEventNeverHidesNewerSnapshot();
  TestRetentionKeepsLatestEvent();
  TestOverlappingBatchesFromOneSensor();
  TestHydrateRestoresCache();

  std::cout << "sensorlink_unit_chunk_store: pass\n";
  return 0;
}
