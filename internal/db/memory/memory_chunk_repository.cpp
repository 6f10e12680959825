#include "memory_chunk_repository.hpp"

#include <algorithm>

namespace sensorlink::db::memory {

using Tx = MemoryTransaction<MemoryChunkRepository::State>;

static Tx& TX(db::Transaction& tx) {
  return static_cast<Tx&>(tx);
}

MemoryChunkRepository::MemoryChunkRepository() = default;

std::unique_ptr<db::Transaction> MemoryChunkRepository::Begin() {
  return std::make_unique<Tx>(store_);
}

Result MemoryChunkRepository::InsertChunk(Transaction& t, const model::ChunkRecord& r) {
  auto& s   = TX(t).Mutable();
  auto  key = std::make_pair(r.sensor_id, r.sequence);
  if (s.chunks.contains(key)) return Result::Err(ErrorCode::ConstraintViolation, "chunk sequence already stored");
  s.chunks.emplace(std::move(key), r);
  return Result::Ok();
}

std::optional<model::ChunkRecord> MemoryChunkRepository::GetChunk(Transaction& t, const std::string& sensor_id, uint64_t sequence) {
  const auto& s  = TX(t).View();
  auto        it = s.chunks.find(std::make_pair(sensor_id, sequence));
  if (it == s.chunks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ChunkRecord> MemoryChunkRepository::ListEventChunks(Transaction& t, const std::string& sensor_id, const std::string& event_id) {
  const auto&                     s = TX(t).View();
  std::vector<model::ChunkRecord> out;
  for (auto it = s.chunks.lower_bound(std::make_pair(sensor_id, uint64_t{0})); it != s.chunks.end() && it->first.first == sensor_id; ++it) {
    if (it->second.event_id == event_id) out.push_back(it->second);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.chunk_index < b.chunk_index; });
  return out;
}

std::vector<uint64_t> MemoryChunkRepository::ListSequencesAfter(Transaction& t, const std::string& sensor_id, uint64_t after_sequence, uint64_t limit) {
  const auto&           s = TX(t).View();
  std::vector<uint64_t> out;
  for (auto it = s.chunks.upper_bound(std::make_pair(sensor_id, after_sequence));
       it != s.chunks.end() && it->first.first == sensor_id && out.size() < limit; ++it) {
    out.push_back(it->first.second);
  }
  return out;
}

Result MemoryChunkRepository::DeleteEventChunksAbove(Transaction& t, const std::string& sensor_id, const std::string& event_id, uint64_t above_sequence) {
  auto& s = TX(t).Mutable();
  for (auto it = s.chunks.upper_bound(std::make_pair(sensor_id, above_sequence)); it != s.chunks.end() && it->first.first == sensor_id;) {
    if (it->second.event_id == event_id) {
      it = s.chunks.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

Result MemoryChunkRepository::UpsertEvent(Transaction& t, const model::EventRecord& r) {
  TX(t).Mutable().events[std::make_pair(r.sensor_id, r.event_id)] = r;
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryChunkRepository::GetEvent(Transaction& t, const std::string& sensor_id, const std::string& event_id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(std::make_pair(sensor_id, event_id));
  if (it == s.events.end()) return std::nullopt;
  return it->second;
}

std::vector<model::EventRecord> MemoryChunkRepository::ListLatestCompleteEvents(Transaction& t) {
  const auto&                                  s = TX(t).View();
  std::map<std::string, const model::EventRecord*> latest;
  for (const auto& [_, event] : s.events) {
    if (event.state != model::EventState::Complete) continue;
    auto& slot = latest[event.sensor_id];
    if (!slot || event.last_sequence > slot->last_sequence) slot = &event;
  }

  std::vector<model::EventRecord> out;
  out.reserve(latest.size());
  for (const auto& [_, event] : latest) {
    out.push_back(*event);
  }
  return out;
}

std::vector<model::EventRecord> MemoryChunkRepository::ListEventsUpdatedBefore(Transaction& t, uint64_t cutoff_ms) {
  const auto&                     s = TX(t).View();
  std::vector<model::EventRecord> out;
  for (const auto& [_, event] : s.events) {
    if (event.updated_at_ms < cutoff_ms) out.push_back(event);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.sensor_id != b.sensor_id) return a.sensor_id < b.sensor_id;
    return a.last_sequence < b.last_sequence;
  });
  return out;
}

Result MemoryChunkRepository::DeleteEvent(Transaction& t, const std::string& sensor_id, const std::string& event_id) {
  auto& s = TX(t).Mutable();
  for (auto it = s.chunks.lower_bound(std::make_pair(sensor_id, uint64_t{0})); it != s.chunks.end() && it->first.first == sensor_id;) {
    if (it->second.event_id == event_id) {
      it = s.chunks.erase(it);
    } else {
      ++it;
    }
  }
  s.events.erase(std::make_pair(sensor_id, event_id));
  return Result::Ok();
}

Result MemoryChunkRepository::UpsertOffset(Transaction& t, const model::SensorOffsetRecord& r) {
  TX(t).Mutable().offsets[r.sensor_id] = r;
  return Result::Ok();
}

std::optional<model::SensorOffsetRecord> MemoryChunkRepository::GetOffset(Transaction& t, const std::string& sensor_id) {
  const auto& s  = TX(t).View();
  auto        it = s.offsets.find(sensor_id);
  if (it == s.offsets.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SensorOffsetRecord> MemoryChunkRepository::ListOffsets(Transaction& t) {
  const auto&                            s = TX(t).View();
  std::vector<model::SensorOffsetRecord> out;
  out.reserve(s.offsets.size());
  for (const auto& [_, offset] : s.offsets) {
    out.push_back(offset);
  }
  return out;
}

} // namespace sensorlink::db::memory
