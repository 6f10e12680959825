#include "offset_tracker.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace sensorlink::store {

namespace {

void ThrowIfError(const sensorlink::db::Result& result, const std::string& prefix) {
  if (!result) {
    throw std::runtime_error(prefix + ": " + result.message);
  }
}

} // namespace

OffsetTracker::OffsetTracker(std::shared_ptr<db::ChunkRepository> repository) : repository_(std::move(repository)) {
}

void OffsetTracker::Load() {
  auto tx      = repository_->Begin();
  auto offsets = repository_->ListOffsets(*tx);
  tx->Commit();

  std::unique_lock lock(mutex_);
  for (const auto& offset : offsets) {
    auto& committed = committed_[offset.sensor_id];
    committed       = std::max(committed, offset.committed_sequence);
  }
}

db::model::SensorOffsetRecord OffsetTracker::LoadRecord(db::Transaction& tx, const std::string& sensor_id) {
  auto record = repository_->GetOffset(tx, sensor_id);
  if (record.has_value()) {
    return *record;
  }

  db::model::SensorOffsetRecord fresh;
  fresh.sensor_id = sensor_id;
  return fresh;
}

uint64_t OffsetTracker::Committed(db::Transaction& tx, const std::string& sensor_id) {
  return LoadRecord(tx, sensor_id).committed_sequence;
}

bool OffsetTracker::Settled(db::Transaction& tx, const std::string& sensor_id, uint64_t sequence,
                            std::unordered_map<std::string, bool>& settled_events) {
  const auto chunk = repository_->GetChunk(tx, sensor_id, sequence);
  if (!chunk.has_value()) {
    return false;
  }

  auto it = settled_events.find(chunk->event_id);
  if (it == settled_events.end()) {
    const auto event = repository_->GetEvent(tx, sensor_id, chunk->event_id);
    const bool done  = event.has_value() && (event->state == db::model::EventState::Complete || event->state == db::model::EventState::Abandoned);
    it               = settled_events.emplace(chunk->event_id, done).first;
  }
  return it->second;
}

OffsetProgress OffsetTracker::Advance(db::Transaction& tx, const std::string& sensor_id) {
  auto           record  = LoadRecord(tx, sensor_id);
  const uint64_t initial = record.committed_sequence;

  OffsetProgress progress{initial, initial};
  bool           holding = false;

  std::unordered_map<std::string, bool> settled_events;
  while (true) {
    const auto sequences = repository_->ListSequencesAfter(tx, sensor_id, progress.received, kScanBatch);

    bool gap = false;
    for (uint64_t sequence : sequences) {
      if (sequence != progress.received + 1) {
        gap = true;
        break;
      }
      progress.received = sequence;

      if (!holding && Settled(tx, sensor_id, sequence, settled_events)) {
        progress.committed = sequence;
      } else {
        holding = true;
      }
    }

    if (gap || sequences.size() < kScanBatch) break;
  }

  if (progress.committed != initial) {
    record.committed_sequence = progress.committed;
    record.updated_at_ms      = sensorlink::util::NowMillis();
    ThrowIfError(repository_->UpsertOffset(tx, record), "advance offset");
  }
  return progress;
}

uint64_t OffsetTracker::SkipExpired(db::Transaction& tx, const std::string& sensor_id, uint64_t expired_upto) {
  auto record = LoadRecord(tx, sensor_id);

  if (expired_upto > record.expired_upto || expired_upto > record.committed_sequence) {
    record.expired_upto       = std::max(record.expired_upto, expired_upto);
    record.committed_sequence = std::max(record.committed_sequence, expired_upto);
    record.updated_at_ms      = sensorlink::util::NowMillis();
    ThrowIfError(repository_->UpsertOffset(tx, record), "skip expired offset");
  }

  return Advance(tx, sensor_id).committed;
}

void OffsetTracker::Publish(const std::string& sensor_id, uint64_t committed) {
  std::unique_lock lock(mutex_);
  auto&            current = committed_[sensor_id];
  if (committed > current) {
    current = committed;
  }
}

uint64_t OffsetTracker::SinceSequence(const std::string& sensor_id) const {
  std::shared_lock lock(mutex_);
  auto             it = committed_.find(sensor_id);
  return it == committed_.end() ? 0 : it->second;
}

std::unordered_map<std::string, uint64_t> OffsetTracker::Snapshot() const {
  std::shared_lock lock(mutex_);
  return committed_;
}

} // namespace sensorlink::store
