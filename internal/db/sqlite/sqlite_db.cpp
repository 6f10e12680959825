#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace sensorlink::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;
constexpr int kOpenFlags     = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

// Every pragma a store runs at open, in order. journal_mode must come first so
// that synchronous=NORMAL is only ever paired with WAL.
std::vector<std::string> OpenPragmas(bool synchronous_full) {
  return {
      "PRAGMA journal_mode=WAL;",
      synchronous_full ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;",
      "PRAGMA foreign_keys=ON;",
      "PRAGMA temp_store=MEMORY;",
      "PRAGMA cache_size=-20000;",
  };
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool synchronous_full) : path_(std::move(path)) {
  if (const int rc = sqlite3_open_v2(path_.c_str(), &db_, kOpenFlags, nullptr); rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::InvalidState("cannot open store '" + path_ + "': " + reason);
  }

  try {
    Configure(synchronous_full);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) {
    return;
  }
  const std::string reason = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw util::InvalidState(path_ + ": " + reason);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    throw util::InvalidState(path_ + ": prepare failed: " + sqlite3_errmsg(db_));
  }
  return stmt;
}

void SqliteDB::Configure(bool synchronous_full) {
  // an acknowledged enqueue or accepted chunk must survive power loss when FULL
  for (const auto& pragma : OpenPragmas(synchronous_full)) {
    Exec(pragma);
  }

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw util::InvalidState(path_ + ": busy_timeout: " + sqlite3_errmsg(db_));
  }
}

} // namespace sensorlink::db::sqlite
