#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace sensorlink::db::sqlite {

using observability::StringField;

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
  state_ = State::kOpen;
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    SENSORLINK_LOG_WARN("sqlite rollback failed", {StringField("path", db_->Path()), StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) {
    throw util::InvalidState("sqlite transaction already finished");
  }
  // a failed COMMIT leaves the transaction open; the destructor rolls it back
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) {
    return;
  }
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace sensorlink::db::sqlite
