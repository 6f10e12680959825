#pragma once

#include <map>
#include <string>
#include <utility>

#include "internal/db/api/chunk_repository.hpp"
#include "memory_tx.hpp"

namespace sensorlink::db::memory {

class MemoryChunkRepository final : public db::ChunkRepository {
public:
  struct State {
    // (sensor_id, sequence)
    std::map<std::pair<std::string, uint64_t>, model::ChunkRecord> chunks;
    // (sensor_id, event_id)
    std::map<std::pair<std::string, std::string>, model::EventRecord> events;
    std::map<std::string, model::SensorOffsetRecord>                  offsets;
  };

  MemoryChunkRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertChunk(Transaction&, const model::ChunkRecord&) override;
  std::optional<model::ChunkRecord> GetChunk(Transaction&, const std::string& sensor_id, uint64_t sequence) override;
  std::vector<model::ChunkRecord> ListEventChunks(Transaction&, const std::string& sensor_id, const std::string& event_id) override;
  std::vector<uint64_t> ListSequencesAfter(Transaction&, const std::string& sensor_id, uint64_t after_sequence, uint64_t limit) override;
  Result DeleteEventChunksAbove(Transaction&, const std::string& sensor_id, const std::string& event_id, uint64_t above_sequence) override;

  Result UpsertEvent(Transaction&, const model::EventRecord&) override;
  std::optional<model::EventRecord> GetEvent(Transaction&, const std::string& sensor_id, const std::string& event_id) override;
  std::vector<model::EventRecord> ListLatestCompleteEvents(Transaction&) override;
  std::vector<model::EventRecord> ListEventsUpdatedBefore(Transaction&, uint64_t cutoff_ms) override;
  Result DeleteEvent(Transaction&, const std::string& sensor_id, const std::string& event_id) override;

  Result UpsertOffset(Transaction&, const model::SensorOffsetRecord&) override;
  std::optional<model::SensorOffsetRecord> GetOffset(Transaction&, const std::string& sensor_id) override;
  std::vector<model::SensorOffsetRecord> ListOffsets(Transaction&) override;

private:
  MemoryStore<State> store_;
};

}
