#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/chunk_repository.hpp"

namespace sensorlink::store {

/*
  Per-sensor committed sequence.

  The persisted value lives in sensor_offsets and only moves inside a
  ChunkStore transaction. The in-memory copy is published after commit and
  serves SinceSequence() without touching the database.

  Invariants:
    - committed only moves forward
    - committed never passes a sequence that is not stored, except over a
      range the sensor reported as expired
    - committed never passes a chunk whose event is still Pending or Failed;
      only Complete and Abandoned events are settled

  The received point walks the same contiguous run but ignores event state.
  It is what a sensor may stream from while an event larger than one window
  is still arriving.
*/
struct OffsetProgress {
  uint64_t committed = 0;
  uint64_t received  = 0;
};

class OffsetTracker {
 public:
  explicit OffsetTracker(std::shared_ptr<db::ChunkRepository> repository);

  // Loads persisted offsets into memory. Call once at startup.
  void Load();

  // Walks stored sequences contiguously from the persisted committed point
  // and persists the new committed value.
  OffsetProgress Advance(db::Transaction& tx, const std::string& sensor_id);

  // Moves the committed point over [committed+1, expired_upto] and advances.
  uint64_t SkipExpired(db::Transaction& tx, const std::string& sensor_id, uint64_t expired_upto);

  // Persisted committed point as seen by tx.
  uint64_t Committed(db::Transaction& tx, const std::string& sensor_id);

  // Makes a committed value visible to readers; lower values are ignored.
  void Publish(const std::string& sensor_id, uint64_t committed);

  // Highest sequence below which every chunk of the sensor is stored. 0 when unknown.
  uint64_t SinceSequence(const std::string& sensor_id) const;

  std::unordered_map<std::string, uint64_t> Snapshot() const;

 private:
  static constexpr uint64_t kScanBatch = 1024;

  bool Settled(db::Transaction& tx, const std::string& sensor_id, uint64_t sequence,
               std::unordered_map<std::string, bool>& settled_events);

  db::model::SensorOffsetRecord LoadRecord(db::Transaction& tx, const std::string& sensor_id);

  std::shared_ptr<db::ChunkRepository>      repository_;
  mutable std::shared_mutex                 mutex_;
  std::unordered_map<std::string, uint64_t> committed_;
};

} // namespace sensorlink::store
