#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/queue_entry_record.hpp"

namespace sensorlink::db {

/*
  Sensor-side queue storage.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Sequence numbers are chosen by the caller from QueueStateRecord and
    persisted in the same transaction, so they are never reused
  - Entries are returned in ascending sequence order
*/

class QueueRepository {
 public:
  virtual ~QueueRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Entries
  // ---------------------------------------------------------------------

  virtual Result InsertEntries(Transaction&, const std::vector<model::QueueEntryRecord>& entries) = 0;

  virtual std::vector<model::QueueEntryRecord> ReadEntriesAfter(Transaction&, uint64_t after_sequence, uint64_t max_entries) = 0;

  virtual Result DeleteEntriesUpTo(Transaction&, uint64_t sequence, uint64_t& deleted) = 0;

  // Deletes entries enqueued before cutoff_ms; max_sequence receives the highest deleted sequence.
  virtual Result DeleteEntriesOlderThan(Transaction&, uint64_t cutoff_ms, uint64_t& deleted, uint64_t& max_sequence) = 0;

  virtual Result RecordAttempt(Transaction&, const std::vector<uint64_t>& sequences, uint64_t attempt_at_ms) = 0;

  virtual uint64_t CountEntries(Transaction&) = 0;

  virtual std::optional<uint64_t> OldestEnqueuedAt(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Counters
  // ---------------------------------------------------------------------

  virtual model::QueueStateRecord GetState(Transaction&) = 0;

  virtual Result PutState(Transaction&, const model::QueueStateRecord&) = 0;
};

} // namespace sensorlink::db
