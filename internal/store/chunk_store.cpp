#include "chunk_store.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <functional>
#include <set>
#include <stdexcept>
#include <utility>

#include "internal/codec/chunk_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/snapshot/snapshot_cache.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "offset_tracker.hpp"

namespace sensorlink::store {

using namespace sensorlink::pipeline::v1;
using sensorlink::db::model::ChunkRecord;
using sensorlink::db::model::EventRecord;
using sensorlink::db::model::EventState;
using sensorlink::observability::StringField;
using sensorlink::observability::UintField;

namespace {

void ThrowIfError(const sensorlink::db::Result& result, const std::string& prefix) {
  if (!result) {
    throw std::runtime_error(prefix + ": " + result.message);
  }
}

std::string SerializeAttributes(const google::protobuf::Map<std::string, std::string>& attributes) {
  google::protobuf::Struct as_struct;
  for (const auto& [key, value] : attributes) {
    (*as_struct.mutable_fields())[key].set_string_value(value);
  }

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(as_struct, &json).ok()) {
    return "{}";
  }
  return json;
}

void DeserializeAttributes(const std::string& raw, google::protobuf::Map<std::string, std::string>* attributes) {
  if (raw.empty()) {
    return;
  }

  google::protobuf::Struct as_struct;
  if (!google::protobuf::util::JsonStringToMessage(raw, &as_struct).ok()) {
    return;
  }

  for (const auto& [key, value] : as_struct.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      (*attributes)[key] = value.string_value();
    }
  }
}

EventRecord NewEvent(const Chunk& chunk, uint64_t now_ms) {
  EventRecord event;
  event.sensor_id            = chunk.sensor_id();
  event.event_id             = chunk.event_id();
  event.chunk_count          = chunk.chunk_count();
  event.total_bytes          = chunk.total_bytes();
  event.event_sha256         = chunk.event_sha256();
  event.created_at_ms        = chunk.created_at_ms();
  event.logical_timestamp_ms = chunk.logical_timestamp_ms();
  event.clock_skew_ms        = chunk.clock_skew_ms();
  event.attributes           = SerializeAttributes(chunk.attributes());
  event.state                = EventState::Pending;
  event.first_sequence       = chunk.sequence();
  event.last_sequence        = chunk.sequence();
  event.updated_at_ms        = now_ms;
  return event;
}

std::vector<Chunk> ToChunks(const EventRecord& event, const std::vector<ChunkRecord>& records) {
  std::vector<Chunk> chunks;
  chunks.reserve(records.size());
  for (const auto& record : records) {
    Chunk chunk;
    chunk.set_sensor_id(record.sensor_id);
    chunk.set_sequence(record.sequence);
    chunk.set_event_id(record.event_id);
    chunk.set_chunk_index(record.chunk_index);
    chunk.set_chunk_count(record.chunk_count);
    chunk.set_payload(record.payload);
    chunk.set_chunk_sha256(record.chunk_sha256);
    chunk.set_compression(record.compression);
    chunk.set_event_sha256(event.event_sha256);
    chunk.set_total_bytes(event.total_bytes);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

Snapshot ToSnapshot(const EventRecord& event) {
  Snapshot snapshot;
  snapshot.set_sensor_id(event.sensor_id);
  snapshot.set_event_id(event.event_id);
  snapshot.set_payload(event.payload);
  snapshot.set_logical_timestamp_ms(event.logical_timestamp_ms);
  snapshot.set_created_at_ms(event.created_at_ms);
  snapshot.set_total_bytes(event.total_bytes);
  snapshot.set_chunk_count(event.chunk_count);
  snapshot.set_updated_at_ms(event.completed_at_ms);
  snapshot.set_event_sha256(event.event_sha256);
  snapshot.set_last_sequence(event.last_sequence);
  DeserializeAttributes(event.attributes, snapshot.mutable_attributes());
  return snapshot;
}

uint32_t DistinctIndexes(const std::vector<ChunkRecord>& records) {
  std::set<uint32_t> indexes;
  for (const auto& record : records) {
    indexes.insert(record.chunk_index);
  }
  return static_cast<uint32_t>(indexes.size());
}

WriteResult Rejected(const Chunk& chunk, std::string reason) {
  WriteResult result;
  result.sequence = chunk.sequence();
  result.outcome  = WriteOutcome::IntegrityError;
  result.reason   = std::move(reason);
  return result;
}

} // namespace

const char* ToString(WriteOutcome outcome) {
  switch (outcome) {
    case WriteOutcome::Accepted:
      return "accepted";
    case WriteOutcome::DuplicateIgnored:
      return "duplicate";
    case WriteOutcome::IntegrityError:
      return "integrity_error";
  }
  return "unknown";
}

ChunkStore::ChunkStore(std::shared_ptr<db::ChunkRepository> repository, std::shared_ptr<OffsetTracker> offsets,
                       std::shared_ptr<sensorlink::snapshot::SnapshotCache> snapshots, ChunkStoreOptions options)
    : repository_(std::move(repository)), offsets_(std::move(offsets)), snapshots_(std::move(snapshots)), options_(options) {
}

std::mutex& ChunkStore::SensorShard(const std::string& sensor_id) {
  return sensor_mu_[std::hash<std::string>{}(sensor_id) % kSensorLockShardCount];
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

WriteResult ChunkStore::WriteOne(db::Transaction& tx, const std::string& sensor_id, const Chunk& chunk, uint64_t committed) {
  if (!codec::VerifyChunk(chunk)) {
    return Rejected(chunk, "chunk hash mismatch");
  }

  auto existing = repository_->GetChunk(tx, sensor_id, chunk.sequence());
  if (existing.has_value()) {
    if (existing->chunk_sha256 == chunk.chunk_sha256() && existing->event_id == chunk.event_id() &&
        existing->chunk_index == chunk.chunk_index()) {
      WriteResult result;
      result.sequence = chunk.sequence();
      result.outcome  = WriteOutcome::DuplicateIgnored;
      return result;
    }
    return Rejected(chunk, "sequence " + std::to_string(chunk.sequence()) + " already stored with different content");
  }

  // committed and already pruned, or skipped as expired
  if (chunk.sequence() <= committed) {
    WriteResult result;
    result.sequence = chunk.sequence();
    result.outcome  = WriteOutcome::DuplicateIgnored;
    return result;
  }

  const uint64_t now_ms = sensorlink::util::NowMillis();

  auto        stored = repository_->GetEvent(tx, sensor_id, chunk.event_id());
  EventRecord event  = stored.has_value() ? *stored : NewEvent(chunk, now_ms);
  if (stored.has_value() &&
      (event.chunk_count != chunk.chunk_count() || event.event_sha256 != chunk.event_sha256() || event.total_bytes != chunk.total_bytes())) {
    return Rejected(chunk, "chunk metadata disagrees with event " + chunk.event_id());
  }

  ChunkRecord record;
  record.sensor_id      = sensor_id;
  record.sequence       = chunk.sequence();
  record.event_id       = chunk.event_id();
  record.chunk_index    = chunk.chunk_index();
  record.chunk_count    = chunk.chunk_count();
  record.payload        = chunk.payload();
  record.chunk_sha256   = chunk.chunk_sha256();
  record.compression    = chunk.compression();
  record.received_at_ms = now_ms;
  ThrowIfError(repository_->InsertChunk(tx, record), "insert chunk");

  event.received_chunks++;
  event.first_sequence = std::min(event.first_sequence, chunk.sequence());
  event.last_sequence  = std::max(event.last_sequence, chunk.sequence());
  event.updated_at_ms  = now_ms;

  WriteResult result;
  result.sequence = chunk.sequence();
  result.outcome  = WriteOutcome::Accepted;

  if (event.state != EventState::Complete && event.state != EventState::Abandoned) {
    const auto records = repository_->ListEventChunks(tx, sensor_id, event.event_id);
    if (DistinctIndexes(records) >= event.chunk_count) {
      try {
        event.payload         = codec::Assemble(ToChunks(event, records));
        event.state           = EventState::Complete;
        event.completed_at_ms = now_ms;
        result.completed      = ToSnapshot(event);
      } catch (const sensorlink::util::IntegrityError& ex) {
        event.assembly_failures++;
        event.state = event.assembly_failures < options_.max_assembly_failures ? EventState::Failed : EventState::Abandoned;
        event.payload.clear();

        SENSORLINK_LOG_ERROR("Event reassembly failed",
                             {StringField("sensor_id", sensor_id), StringField("event_id", event.event_id), StringField("error", ex.what()),
                              UintField("assembly_failures", event.assembly_failures)});

        if (event.state == EventState::Failed) {
          // nothing of a failed event is committed; drop it all so the sensor resends it
          ThrowIfError(repository_->DeleteEventChunksAbove(tx, sensor_id, event.event_id, committed), "discard failed event chunks");
          event.received_chunks = static_cast<uint32_t>(repository_->ListEventChunks(tx, sensor_id, event.event_id).size());
          result.outcome        = WriteOutcome::IntegrityError;
          result.reason         = ex.what();
        } else {
          sensorlink::observability::Metrics::Instance().RecordIntegrityError(sensor_id);
          SENSORLINK_LOG_WARN("Giving up on event after repeated reassembly failures",
                              {StringField("sensor_id", sensor_id), StringField("event_id", event.event_id)});
        }
      } catch (const sensorlink::util::IncompleteEvent&) {
        // waiting for more chunks
      }
    }
  }

  ThrowIfError(repository_->UpsertEvent(tx, event), "upsert event");
  return result;
}

BatchResult ChunkStore::WriteBatch(const std::string& sensor_id, const std::vector<Chunk>& chunks) {
  for (const auto& chunk : chunks) {
    if (chunk.sensor_id() != sensor_id) {
      throw sensorlink::util::InvalidArgument("chunk " + std::to_string(chunk.sequence()) + " belongs to sensor " + chunk.sensor_id() +
                                              ", not " + sensor_id);
    }
    codec::ChunkCompression(chunk);
  }

  BatchResult batch;
  {
    std::lock_guard lock(SensorShard(sensor_id));
    auto            tx = repository_->Begin();

    const uint64_t committed = offsets_->Committed(*tx, sensor_id);
    batch.results.reserve(chunks.size());
    for (const auto& chunk : chunks) {
      batch.results.push_back(WriteOne(*tx, sensor_id, chunk, committed));
    }

    const auto progress      = offsets_->Advance(*tx, sensor_id);
    batch.committed_sequence = progress.committed;
    batch.received_sequence  = progress.received;
    tx->Commit();

    offsets_->Publish(sensor_id, batch.committed_sequence);
    for (auto& result : batch.results) {
      result.committed_sequence = batch.committed_sequence;
      if (result.completed.has_value()) {
        snapshots_->Publish(*result.completed);
      }
    }
  }

  auto& metrics = sensorlink::observability::Metrics::Instance();
  for (const auto& result : batch.results) {
    metrics.RecordChunkOutcome(ToString(result.outcome));
    if (result.outcome == WriteOutcome::IntegrityError) {
      metrics.RecordIntegrityError(sensor_id);
    }
  }
  return batch;
}

WriteResult ChunkStore::Write(const Chunk& chunk) {
  auto batch = WriteBatch(chunk.sensor_id(), {chunk});
  return std::move(batch.results.front());
}

uint64_t ChunkStore::ApplyExpired(const std::string& sensor_id, uint64_t expired_upto) {
  std::lock_guard lock(SensorShard(sensor_id));

  if (expired_upto <= offsets_->SinceSequence(sensor_id)) {
    return offsets_->SinceSequence(sensor_id);
  }

  auto           tx        = repository_->Begin();
  const uint64_t committed = offsets_->SkipExpired(*tx, sensor_id, expired_upto);
  tx->Commit();

  offsets_->Publish(sensor_id, committed);
  SENSORLINK_LOG_WARN("Skipped sequences expired by sensor retention",
                      {StringField("sensor_id", sensor_id), UintField("expired_upto", expired_upto), UintField("committed", committed)});
  return committed;
}

// ------------------------------------------------------------
// Retention / hydration
// ------------------------------------------------------------

uint64_t ChunkStore::PruneRetention(std::chrono::milliseconds retention) {
  const uint64_t now_ms       = sensorlink::util::NowMillis();
  const uint64_t retention_ms = static_cast<uint64_t>(retention.count());
  const uint64_t cutoff_ms    = now_ms > retention_ms ? now_ms - retention_ms : 0;

  auto tx = repository_->Begin();

  std::set<std::pair<std::string, std::string>> keep;
  for (const auto& latest : repository_->ListLatestCompleteEvents(*tx)) {
    keep.emplace(latest.sensor_id, latest.event_id);
  }

  uint64_t removed = 0;
  for (const auto& event : repository_->ListEventsUpdatedBefore(*tx, cutoff_ms)) {
    if (keep.contains({event.sensor_id, event.event_id})) continue;
    // never open a hole above the committed point
    if (event.last_sequence > offsets_->Committed(*tx, event.sensor_id)) continue;

    ThrowIfError(repository_->DeleteEvent(*tx, event.sensor_id, event.event_id), "prune event");
    ++removed;
  }

  tx->Commit();

  if (removed > 0) {
    SENSORLINK_LOG_INFO("Pruned events past retention", {UintField("events", removed)});
  }
  return removed;
}

std::size_t ChunkStore::Hydrate() {
  auto tx     = repository_->Begin();
  auto latest = repository_->ListLatestCompleteEvents(*tx);
  tx->Commit();

  std::size_t published = 0;
  for (const auto& event : latest) {
    if (snapshots_->Publish(ToSnapshot(event))) {
      ++published;
    }
  }
  return published;
}

std::optional<db::model::EventRecord> ChunkStore::GetEvent(const std::string& sensor_id, const std::string& event_id) {
  auto tx    = repository_->Begin();
  auto event = repository_->GetEvent(*tx, sensor_id, event_id);
  tx->Commit();
  return event;
}

uint64_t ChunkStore::CommittedSequence(const std::string& sensor_id) const {
  return offsets_->SinceSequence(sensor_id);
}

} // namespace sensorlink::store
