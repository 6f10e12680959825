#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"
#include "sqlite_db.hpp"

namespace sensorlink::db::sqlite {

/*
  One BEGIN IMMEDIATE ... COMMIT unit on a store connection.

  The connection's TxMutex() is held for the whole lifetime, so a thread
  must not open a second transaction on the same store before finishing
  the first. An unfinished transaction rolls back on destruction.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

 private:
  enum class State { kBeginning, kOpen, kCommitted, kRolledBack };

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  State                        state_ = State::kBeginning;
};

} // namespace sensorlink::db::sqlite
