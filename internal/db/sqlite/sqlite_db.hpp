#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sensorlink::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per store. Transactions on the connection are
  serialized through TxMutex().
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool synchronous_full = false);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, synchronous, busy timeout)
  void Configure(bool synchronous_full);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace sensorlink::db::sqlite
