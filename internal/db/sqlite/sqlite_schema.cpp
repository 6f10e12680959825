#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace sensorlink::db::sqlite {

void BootstrapQueueSchema(const std::shared_ptr<SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS queue_entries (sequence INTEGER PRIMARY KEY, event_id TEXT NOT NULL, chunk_index INTEGER NOT NULL, chunk_count INTEGER NOT NULL, payload_bytes INTEGER NOT NULL, chunk BLOB NOT NULL, enqueued_at_ms INTEGER NOT NULL, attempt_count INTEGER NOT NULL DEFAULT 0, last_attempt_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS queue_entries_enqueued_at ON queue_entries(enqueued_at_ms);",
      "CREATE TABLE IF NOT EXISTS queue_state (id INTEGER PRIMARY KEY CHECK (id = 1), last_sequence INTEGER NOT NULL, acked_upto INTEGER NOT NULL, expired_upto INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO queue_state(id,last_sequence,acked_upto,expired_upto) VALUES(1,0,0,0);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT sequence,event_id,chunk_index,chunk_count,payload_bytes,chunk,enqueued_at_ms,attempt_count,last_attempt_at_ms FROM queue_entries LIMIT 1;");
  sqlite_db->Exec("SELECT last_sequence,acked_upto,expired_upto FROM queue_state LIMIT 1;");
}

void BootstrapChunkStoreSchema(const std::shared_ptr<SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS chunks (sensor_id TEXT NOT NULL, sequence INTEGER NOT NULL, event_id TEXT NOT NULL, chunk_index INTEGER NOT NULL, chunk_count INTEGER NOT NULL, payload BLOB NOT NULL, chunk_sha256 BLOB NOT NULL, received_at_ms INTEGER NOT NULL, compression TEXT NOT NULL DEFAULT '', PRIMARY KEY (sensor_id, sequence));",
      "CREATE INDEX IF NOT EXISTS chunks_event ON chunks(sensor_id, event_id);",
      "CREATE TABLE IF NOT EXISTS events (sensor_id TEXT NOT NULL, event_id TEXT NOT NULL, chunk_count INTEGER NOT NULL, total_bytes INTEGER NOT NULL, event_sha256 BLOB NOT NULL, created_at_ms INTEGER NOT NULL, logical_timestamp_ms INTEGER NOT NULL, clock_skew_ms INTEGER NOT NULL, attributes TEXT NOT NULL, state INTEGER NOT NULL, received_chunks INTEGER NOT NULL, first_sequence INTEGER NOT NULL, last_sequence INTEGER NOT NULL, assembly_failures INTEGER NOT NULL, payload BLOB, completed_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (sensor_id, event_id));",
      "CREATE INDEX IF NOT EXISTS events_latest ON events(sensor_id, state, last_sequence);",
      "CREATE TABLE IF NOT EXISTS sensor_offsets (sensor_id TEXT PRIMARY KEY, committed_sequence INTEGER NOT NULL, expired_upto INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT sensor_id,sequence,event_id,chunk_index,chunk_count,payload,chunk_sha256,received_at_ms,compression FROM chunks LIMIT 1;");
  sqlite_db->Exec("SELECT sensor_id,committed_sequence,expired_upto,updated_at_ms FROM sensor_offsets LIMIT 1;");
}

} // namespace sensorlink::db::sqlite
