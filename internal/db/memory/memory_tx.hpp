#pragma once

#include <mutex>
#include <utility>

#include "internal/db/api/transaction.hpp"

namespace sensorlink::db::memory {

/*
  Committed state shared by a memory repository and its transactions.
*/
template <typename State>
struct MemoryStore {
  std::mutex mutex;
  State      committed;
};

/*
  Transaction = snapshot + write set

  The store mutex is held for the lifetime of the transaction, so
  transactions are serialized the same way SQLite's single writer is.
*/
template <typename State>
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryStore<State>& store) : store_(store), lock_(store.mutex), working_(store.committed) {}

  ~MemoryTransaction() override = default;

  void Commit() override {
    store_.committed = std::move(working_);
    committed_       = true;
    lock_.unlock();
  }

  void Rollback() override {
    working_ = store_.committed;
    if (lock_.owns_lock()) lock_.unlock();
  }

  bool IsCommitted() const override {
    return committed_;
  }

  State& Mutable() {
    return working_;
  }
  const State& View() const {
    return working_;
  }

 private:
  MemoryStore<State>&          store_;
  std::unique_lock<std::mutex> lock_;
  State                        working_;
  bool                         committed_ = false;
};

} // namespace sensorlink::db::memory
