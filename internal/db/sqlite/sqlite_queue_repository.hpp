#pragma once

#include <memory>

#include "internal/db/api/queue_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace sensorlink::db::sqlite {

class SqliteQueueRepository final : public db::QueueRepository {
public:
  explicit SqliteQueueRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntries(Transaction&, const std::vector<model::QueueEntryRecord>& entries) override;
  std::vector<model::QueueEntryRecord> ReadEntriesAfter(Transaction&, uint64_t after_sequence, uint64_t max_entries) override;
  Result DeleteEntriesUpTo(Transaction&, uint64_t sequence, uint64_t& deleted) override;
  Result DeleteEntriesOlderThan(Transaction&, uint64_t cutoff_ms, uint64_t& deleted, uint64_t& max_sequence) override;
  Result RecordAttempt(Transaction&, const std::vector<uint64_t>& sequences, uint64_t attempt_at_ms) override;
  uint64_t CountEntries(Transaction&) override;
  std::optional<uint64_t> OldestEnqueuedAt(Transaction&) override;

  model::QueueStateRecord GetState(Transaction&) override;
  Result PutState(Transaction&, const model::QueueStateRecord&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

}
