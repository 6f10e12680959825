#include "memory_queue_repository.hpp"

#include <iterator>

namespace sensorlink::db::memory {

using Tx = MemoryTransaction<MemoryQueueRepository::State>;

static Tx& TX(db::Transaction& tx) {
  return static_cast<Tx&>(tx);
}

MemoryQueueRepository::MemoryQueueRepository() = default;

std::unique_ptr<db::Transaction> MemoryQueueRepository::Begin() {
  return std::make_unique<Tx>(store_);
}

Result MemoryQueueRepository::InsertEntries(Transaction& t, const std::vector<model::QueueEntryRecord>& entries) {
  auto& s = TX(t).Mutable();
  for (const auto& e : entries) {
    if (s.entries.contains(e.sequence)) return Result::Err(ErrorCode::ConstraintViolation, "duplicate sequence");
  }
  for (const auto& e : entries) {
    s.entries.emplace(e.sequence, e);
  }
  return Result::Ok();
}

std::vector<model::QueueEntryRecord> MemoryQueueRepository::ReadEntriesAfter(Transaction& t, uint64_t after_sequence, uint64_t max_entries) {
  const auto&                          s = TX(t).View();
  std::vector<model::QueueEntryRecord> out;
  for (auto it = s.entries.upper_bound(after_sequence); it != s.entries.end() && out.size() < max_entries; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryQueueRepository::DeleteEntriesUpTo(Transaction& t, uint64_t sequence, uint64_t& deleted) {
  auto& s   = TX(t).Mutable();
  auto  end = s.entries.upper_bound(sequence);
  deleted   = static_cast<uint64_t>(std::distance(s.entries.begin(), end));
  s.entries.erase(s.entries.begin(), end);
  return Result::Ok();
}

Result MemoryQueueRepository::DeleteEntriesOlderThan(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted, uint64_t& max_sequence) {
  auto& s      = TX(t).Mutable();
  deleted      = 0;
  max_sequence = 0;
  for (auto it = s.entries.begin(); it != s.entries.end();) {
    if (it->second.enqueued_at_ms < cutoff_ms) {
      max_sequence = it->first;
      ++deleted;
      it = s.entries.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

Result MemoryQueueRepository::RecordAttempt(Transaction& t, const std::vector<uint64_t>& sequences, uint64_t attempt_at_ms) {
  auto& s = TX(t).Mutable();
  for (uint64_t sequence : sequences) {
    auto it = s.entries.find(sequence);
    if (it == s.entries.end()) continue;
    it->second.attempt_count++;
    it->second.last_attempt_at_ms = attempt_at_ms;
  }
  return Result::Ok();
}

uint64_t MemoryQueueRepository::CountEntries(Transaction& t) {
  return TX(t).View().entries.size();
}

std::optional<uint64_t> MemoryQueueRepository::OldestEnqueuedAt(Transaction& t) {
  const auto&             s = TX(t).View();
  std::optional<uint64_t> oldest;
  for (const auto& [_, entry] : s.entries) {
    if (!oldest || entry.enqueued_at_ms < *oldest) oldest = entry.enqueued_at_ms;
  }
  return oldest;
}

model::QueueStateRecord MemoryQueueRepository::GetState(Transaction& t) {
  return TX(t).View().counters;
}

Result MemoryQueueRepository::PutState(Transaction& t, const model::QueueStateRecord& r) {
  TX(t).Mutable().counters = r;
  return Result::Ok();
}

} // namespace sensorlink::db::memory
