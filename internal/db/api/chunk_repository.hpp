#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/chunk_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/sensor_offset_record.hpp"

namespace sensorlink::db {

/*
  Collector-side chunk store.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - (sensor_id, sequence) is unique; a second insert is a ConstraintViolation
  - Reads inside a transaction see its writes

  The DB is the source of truth for:
    received chunks
    event assembly state
    per-sensor committed sequence
*/

class ChunkRepository {
 public:
  virtual ~ChunkRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Chunks
  // ---------------------------------------------------------------------

  virtual Result InsertChunk(Transaction&, const model::ChunkRecord&) = 0;

  virtual std::optional<model::ChunkRecord> GetChunk(Transaction&, const std::string& sensor_id, uint64_t sequence) = 0;

  virtual std::vector<model::ChunkRecord> ListEventChunks(Transaction&, const std::string& sensor_id, const std::string& event_id) = 0;

  // Stored sequences > after_sequence in ascending order, at most limit.
  virtual std::vector<uint64_t> ListSequencesAfter(Transaction&, const std::string& sensor_id, uint64_t after_sequence, uint64_t limit) = 0;

  virtual Result DeleteEventChunksAbove(Transaction&, const std::string& sensor_id, const std::string& event_id, uint64_t above_sequence) = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  virtual Result UpsertEvent(Transaction&, const model::EventRecord&) = 0;

  virtual std::optional<model::EventRecord> GetEvent(Transaction&, const std::string& sensor_id, const std::string& event_id) = 0;

  // Per sensor, the Complete event with the highest last_sequence.
  virtual std::vector<model::EventRecord> ListLatestCompleteEvents(Transaction&) = 0;

  virtual std::vector<model::EventRecord> ListEventsUpdatedBefore(Transaction&, uint64_t cutoff_ms) = 0;

  // Removes the event row and all of its chunks.
  virtual Result DeleteEvent(Transaction&, const std::string& sensor_id, const std::string& event_id) = 0;

  // ---------------------------------------------------------------------
  // Offsets
  // ---------------------------------------------------------------------

  virtual Result UpsertOffset(Transaction&, const model::SensorOffsetRecord&) = 0;

  virtual std::optional<model::SensorOffsetRecord> GetOffset(Transaction&, const std::string& sensor_id) = 0;

  virtual std::vector<model::SensorOffsetRecord> ListOffsets(Transaction&) = 0;
};

} // namespace sensorlink::db
