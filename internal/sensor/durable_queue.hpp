#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/queue_repository.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::sensor {

/*
  Crash-safe FIFO of chunks awaiting acknowledgement.

  Sequences come from a persisted counter and are never reused, even after
  ack, expiry or a restart. Mutations are serialized by a writer mutex.
*/
class DurableQueue {
 public:
  explicit DurableQueue(std::shared_ptr<db::QueueRepository> repository);

  // Assigns sequences, stamps them on the chunks and persists all of them in one transaction.
  std::vector<uint64_t> Enqueue(std::vector<sensorlink::pipeline::v1::Chunk>& chunks);

  // Entries with sequence > from_sequence. The first entry is returned even if it alone exceeds max_bytes.
  std::vector<sensorlink::pipeline::v1::Chunk> PeekRange(uint64_t from_sequence, uint32_t max_chunks, uint64_t max_bytes);

  // Deletes every entry <= sequence. Returns the number removed.
  uint64_t AckUpto(uint64_t sequence);

  uint64_t QueueDepth();

  // Bounded loss: entries older than retention are dropped and remembered in ExpiredUpto().
  uint64_t ExpireOlderThan(std::chrono::milliseconds retention);

  void RecordAttempt(const std::vector<uint64_t>& sequences);

  std::chrono::milliseconds OldestPendingAge();

  uint64_t LastAckedSequence();
  uint64_t ExpiredUpto();
  uint64_t LastSequence();

  // Makes sure new sequences are assigned above floor.
  void EnsureSequenceFloor(uint64_t floor);

 private:
  db::model::QueueStateRecord ReadState();

  std::shared_ptr<db::QueueRepository> repository_;
  std::mutex                           writer_mutex_;
};

} // namespace sensorlink::sensor
