#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/chunk_repository.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::snapshot {
class SnapshotCache;
}

namespace sensorlink::store {

class OffsetTracker;

enum class WriteOutcome {
  Accepted,
  DuplicateIgnored,
  IntegrityError,
};

const char* ToString(WriteOutcome outcome);

struct WriteResult {
  uint64_t     sequence = 0;
  WriteOutcome outcome  = WriteOutcome::Accepted;
  std::string  reason;
  // committed point after the write transaction
  uint64_t committed_sequence = 0;
  // set when this write completed its event
  std::optional<sensorlink::pipeline::v1::Snapshot> completed;
};

struct BatchResult {
  std::vector<WriteResult> results;
  uint64_t                 committed_sequence = 0;
  // contiguous stored point, including chunks of events still arriving
  uint64_t received_sequence = 0;
};

struct ChunkStoreOptions {
  // After this many payload hash failures the event is Abandoned: its chunks
  // are kept and the committed point moves past it.
  uint32_t max_assembly_failures = 3;
};

/*
  Collector-side chunk storage with deduplication and reassembly.

  Every write for one sensor runs under that sensor's shard lock in a single
  transaction: insert, reassembly attempt, offset advance. Snapshots of
  completed events are published only after commit.

  The committed point stays below the first sequence of any event that has
  not completed, so a failed reassembly can always discard and re-request
  every chunk of that event.
*/
class ChunkStore {
 public:
  ChunkStore(std::shared_ptr<db::ChunkRepository> repository, std::shared_ptr<OffsetTracker> offsets,
             std::shared_ptr<sensorlink::snapshot::SnapshotCache> snapshots, ChunkStoreOptions options = {});

  // Chunks must all belong to sensor_id. Throws util::InvalidArgument otherwise.
  BatchResult WriteBatch(const std::string& sensor_id, const std::vector<sensorlink::pipeline::v1::Chunk>& chunks);

  WriteResult Write(const sensorlink::pipeline::v1::Chunk& chunk);

  // Sensor reported sequences up to expired_upto as dropped by its retention.
  uint64_t ApplyExpired(const std::string& sensor_id, uint64_t expired_upto);

  // Deletes events (and their chunks) untouched for longer than retention that
  // sit at or below the committed point. The latest complete event of each
  // sensor is kept. Returns the number of events removed.
  uint64_t PruneRetention(std::chrono::milliseconds retention);

  // Fills the snapshot cache from the latest complete event of each sensor.
  std::size_t Hydrate();

  std::optional<db::model::EventRecord> GetEvent(const std::string& sensor_id, const std::string& event_id);

  uint64_t CommittedSequence(const std::string& sensor_id) const;

 private:
  static constexpr std::size_t kSensorLockShardCount = 64;

  std::mutex& SensorShard(const std::string& sensor_id);

  WriteResult WriteOne(db::Transaction& tx, const std::string& sensor_id, const sensorlink::pipeline::v1::Chunk& chunk,
                       uint64_t committed);

  std::shared_ptr<db::ChunkRepository>                 repository_;
  std::shared_ptr<OffsetTracker>                       offsets_;
  std::shared_ptr<sensorlink::snapshot::SnapshotCache> snapshots_;
  ChunkStoreOptions                                    options_;

  std::array<std::mutex, kSensorLockShardCount> sensor_mu_;
};

} // namespace sensorlink::store
