#include "durable_queue.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sensorlink::sensor {

using sensorlink::db::model::QueueEntryRecord;
using sensorlink::observability::StringField;
using sensorlink::observability::UintField;
using sensorlink::pipeline::v1::Chunk;

namespace {

void ThrowIfError(const sensorlink::db::Result& result, const std::string& prefix) {
  if (!result) {
    throw std::runtime_error(prefix + ": " + result.message);
  }
}

} // namespace

DurableQueue::DurableQueue(std::shared_ptr<db::QueueRepository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("DurableQueue requires a repository");
  }
}

std::vector<uint64_t> DurableQueue::Enqueue(std::vector<Chunk>& chunks) {
  std::vector<uint64_t> sequences;
  if (chunks.empty()) {
    return sequences;
  }

  std::lock_guard lock(writer_mutex_);
  auto            tx    = repository_->Begin();
  auto            state = repository_->GetState(*tx);

  const uint64_t now_ms = util::NowMillis();

  std::vector<QueueEntryRecord> entries;
  entries.reserve(chunks.size());
  sequences.reserve(chunks.size());

  for (auto& chunk : chunks) {
    chunk.set_sequence(++state.last_sequence);

    QueueEntryRecord entry;
    entry.sequence      = chunk.sequence();
    entry.event_id      = chunk.event_id();
    entry.chunk_index   = chunk.chunk_index();
    entry.chunk_count   = chunk.chunk_count();
    entry.payload_bytes = chunk.payload().size();
    if (!chunk.SerializeToString(&entry.chunk)) {
      throw std::runtime_error("enqueue: failed to serialize chunk " + std::to_string(entry.sequence));
    }
    entry.enqueued_at_ms = now_ms;

    sequences.push_back(entry.sequence);
    entries.push_back(std::move(entry));
  }

  ThrowIfError(repository_->InsertEntries(*tx, entries), "enqueue");
  ThrowIfError(repository_->PutState(*tx, state), "enqueue state");
  tx->Commit();

  SENSORLINK_LOG_DEBUG("Chunks enqueued", {StringField("event_id", chunks.front().event_id()), UintField("first_sequence", sequences.front()),
                                           UintField("last_sequence", sequences.back())});
  return sequences;
}

std::vector<Chunk> DurableQueue::PeekRange(uint64_t from_sequence, uint32_t max_chunks, uint64_t max_bytes) {
  std::vector<Chunk> chunks;
  if (max_chunks == 0) {
    return chunks;
  }

  std::vector<QueueEntryRecord> entries;
  {
    auto tx = repository_->Begin();
    entries = repository_->ReadEntriesAfter(*tx, from_sequence, max_chunks);
    tx->Commit();
  }

  uint64_t bytes = 0;
  for (const auto& entry : entries) {
    if (!chunks.empty() && max_bytes != 0 && bytes + entry.payload_bytes > max_bytes) {
      break;
    }

    Chunk chunk;
    if (!chunk.ParseFromString(entry.chunk)) {
      throw util::IntegrityError("queue entry " + std::to_string(entry.sequence) + " is not a valid chunk");
    }
    bytes += entry.payload_bytes;
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

uint64_t DurableQueue::AckUpto(uint64_t sequence) {
  std::lock_guard lock(writer_mutex_);
  auto            tx    = repository_->Begin();
  auto            state = repository_->GetState(*tx);

  uint64_t deleted = 0;
  ThrowIfError(repository_->DeleteEntriesUpTo(*tx, sequence, deleted), "ack");

  if (sequence > state.acked_upto) {
    state.acked_upto = std::min(sequence, state.last_sequence);
    ThrowIfError(repository_->PutState(*tx, state), "ack state");
  }
  tx->Commit();
  return deleted;
}

uint64_t DurableQueue::QueueDepth() {
  auto tx    = repository_->Begin();
  auto depth = repository_->CountEntries(*tx);
  tx->Commit();
  return depth;
}

uint64_t DurableQueue::ExpireOlderThan(std::chrono::milliseconds retention) {
  const uint64_t now_ms = util::NowMillis();
  const uint64_t window = static_cast<uint64_t>(retention.count());
  if (retention.count() <= 0 || window >= now_ms) {
    return 0;
  }

  std::lock_guard lock(writer_mutex_);
  auto            tx = repository_->Begin();

  uint64_t deleted      = 0;
  uint64_t max_sequence = 0;
  ThrowIfError(repository_->DeleteEntriesOlderThan(*tx, now_ms - window, deleted, max_sequence), "expire");

  if (deleted > 0) {
    auto state = repository_->GetState(*tx);
    if (max_sequence > state.expired_upto) {
      state.expired_upto = max_sequence;
      ThrowIfError(repository_->PutState(*tx, state), "expire state");
    }
  }
  tx->Commit();

  if (deleted > 0) {
    SENSORLINK_LOG_WARN("Queue entries expired before acknowledgement", {UintField("count", deleted), UintField("expired_upto", max_sequence)});
  }
  return deleted;
}

void DurableQueue::RecordAttempt(const std::vector<uint64_t>& sequences) {
  if (sequences.empty()) {
    return;
  }

  std::lock_guard lock(writer_mutex_);
  auto            tx = repository_->Begin();
  ThrowIfError(repository_->RecordAttempt(*tx, sequences, util::NowMillis()), "record attempt");
  tx->Commit();
}

std::chrono::milliseconds DurableQueue::OldestPendingAge() {
  auto tx     = repository_->Begin();
  auto oldest = repository_->OldestEnqueuedAt(*tx);
  tx->Commit();

  const uint64_t now_ms = util::NowMillis();
  if (!oldest || *oldest >= now_ms) {
    return std::chrono::milliseconds{0};
  }
  return std::chrono::milliseconds{static_cast<int64_t>(now_ms - *oldest)};
}

db::model::QueueStateRecord DurableQueue::ReadState() {
  auto tx    = repository_->Begin();
  auto state = repository_->GetState(*tx);
  tx->Commit();
  return state;
}

uint64_t DurableQueue::LastAckedSequence() {
  return ReadState().acked_upto;
}

uint64_t DurableQueue::ExpiredUpto() {
  return ReadState().expired_upto;
}

uint64_t DurableQueue::LastSequence() {
  return ReadState().last_sequence;
}

void DurableQueue::EnsureSequenceFloor(uint64_t floor) {
  std::lock_guard lock(writer_mutex_);
  auto            tx    = repository_->Begin();
  auto            state = repository_->GetState(*tx);
  if (state.last_sequence >= floor) {
    tx->Rollback();
    return;
  }

  SENSORLINK_LOG_WARN("Raising sequence counter to the collector's committed point",
                      {UintField("local_last_sequence", state.last_sequence), UintField("committed_sequence", floor)});
  state.last_sequence = floor;
  state.acked_upto    = std::max(state.acked_upto, floor);
  ThrowIfError(repository_->PutState(*tx, state), "sequence floor");
  tx->Commit();
}

} // namespace sensorlink::sensor
