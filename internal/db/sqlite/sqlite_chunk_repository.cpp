#include "sqlite_chunk_repository.hpp"

#include <sqlite3.h>

#include "sqlite_bind.hpp"

namespace sensorlink::db::sqlite {

using sensorlink::db::ErrorCode;
using sensorlink::db::Result;

namespace {

constexpr const char* kChunkColumns =
    "sensor_id,sequence,event_id,chunk_index,chunk_count,payload,chunk_sha256,received_at_ms,compression";

constexpr const char* kEventColumns =
    "sensor_id,event_id,chunk_count,total_bytes,event_sha256,created_at_ms,logical_timestamp_ms,clock_skew_ms,"
    "attributes,state,received_chunks,first_sequence,last_sequence,assembly_failures,payload,completed_at_ms,updated_at_ms";

model::ChunkRecord ReadChunk(sqlite3_stmt* st) {
    model::ChunkRecord r;
    r.sensor_id      = ColText(st, 0);
    r.sequence       = ColU64(st, 1);
    r.event_id       = ColText(st, 2);
    r.chunk_index    = ColU32(st, 3);
    r.chunk_count    = ColU32(st, 4);
    r.payload        = ColBlob(st, 5);
    r.chunk_sha256   = ColBlob(st, 6);
    r.received_at_ms = ColU64(st, 7);
    r.compression    = ColText(st, 8);
    return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
    model::EventRecord r;
    r.sensor_id            = ColText(st, 0);
    r.event_id             = ColText(st, 1);
    r.chunk_count          = ColU32(st, 2);
    r.total_bytes          = ColU64(st, 3);
    r.event_sha256         = ColBlob(st, 4);
    r.created_at_ms        = ColU64(st, 5);
    r.logical_timestamp_ms = ColI64(st, 6);
    r.clock_skew_ms        = ColI64(st, 7);
    r.attributes           = ColText(st, 8);
    r.state                = static_cast<model::EventState>(sqlite3_column_int(st, 9));
    r.received_chunks      = ColU32(st, 10);
    r.first_sequence       = ColU64(st, 11);
    r.last_sequence        = ColU64(st, 12);
    r.assembly_failures    = ColU32(st, 13);
    r.payload              = ColBlob(st, 14);
    r.completed_at_ms      = ColU64(st, 15);
    r.updated_at_ms        = ColU64(st, 16);
    return r;
}

model::SensorOffsetRecord ReadOffset(sqlite3_stmt* st) {
    model::SensorOffsetRecord r;
    r.sensor_id          = ColText(st, 0);
    r.committed_sequence = ColU64(st, 1);
    r.expired_upto       = ColU64(st, 2);
    r.updated_at_ms      = ColU64(st, 3);
    return r;
}

} // namespace

SqliteChunkRepository::SqliteChunkRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteChunkRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteChunkRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result SqliteChunkRepository::InsertChunk(Transaction& t, const model::ChunkRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO chunks(") + kChunkColumns + ") VALUES(?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.sensor_id);
    BindU64(st, 2, r.sequence);
    BindText(st, 3, r.event_id);
    BindU64(st, 4, r.chunk_index);
    BindU64(st, 5, r.chunk_count);
    BindBlob(st, 6, r.payload);
    BindBlob(st, 7, r.chunk_sha256);
    BindU64(st, 8, r.received_at_ms);
    BindText(st, 9, r.compression);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::ChunkRecord>
SqliteChunkRepository::GetChunk(Transaction& t, const std::string& sensor_id, uint64_t sequence) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kChunkColumns + " FROM chunks WHERE sensor_id=? AND sequence=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, sensor_id);
    BindU64(st, 2, sequence);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadChunk(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::ChunkRecord>
SqliteChunkRepository::ListEventChunks(Transaction& t, const std::string& sensor_id, const std::string& event_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kChunkColumns +
                            " FROM chunks WHERE sensor_id=? AND event_id=? ORDER BY chunk_index ASC, sequence ASC;";

    std::vector<model::ChunkRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindText(st, 1, sensor_id);
    BindText(st, 2, event_id);

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadChunk(st));
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<uint64_t>
SqliteChunkRepository::ListSequencesAfter(Transaction& t, const std::string& sensor_id, uint64_t after_sequence, uint64_t limit) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT sequence FROM chunks WHERE sensor_id=? AND sequence>? ORDER BY sequence ASC LIMIT ?;";

    std::vector<uint64_t> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindText(st, 1, sensor_id);
    BindU64(st, 2, after_sequence);
    BindU64(st, 3, limit);

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ColU64(st, 0));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteChunkRepository::DeleteEventChunksAbove(Transaction& t, const std::string& sensor_id, const std::string& event_id, uint64_t above_sequence) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM chunks WHERE sensor_id=? AND event_id=? AND sequence>?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, sensor_id);
    BindText(st, 2, event_id);
    BindU64(st, 3, above_sequence);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteChunkRepository::UpsertEvent(Transaction& t, const model::EventRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql =
        std::string("INSERT INTO events(") + kEventColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(sensor_id,event_id) DO UPDATE SET "
        "chunk_count=excluded.chunk_count, total_bytes=excluded.total_bytes, event_sha256=excluded.event_sha256, "
        "created_at_ms=excluded.created_at_ms, logical_timestamp_ms=excluded.logical_timestamp_ms, "
        "clock_skew_ms=excluded.clock_skew_ms, attributes=excluded.attributes, state=excluded.state, "
        "received_chunks=excluded.received_chunks, first_sequence=excluded.first_sequence, "
        "last_sequence=excluded.last_sequence, assembly_failures=excluded.assembly_failures, "
        "payload=excluded.payload, completed_at_ms=excluded.completed_at_ms, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.sensor_id);
    BindText(st, 2, r.event_id);
    BindU64(st, 3, r.chunk_count);
    BindU64(st, 4, r.total_bytes);
    BindBlob(st, 5, r.event_sha256);
    BindU64(st, 6, r.created_at_ms);
    BindI64(st, 7, r.logical_timestamp_ms);
    BindI64(st, 8, r.clock_skew_ms);
    BindText(st, 9, r.attributes);
    sqlite3_bind_int(st, 10, static_cast<int>(r.state));
    BindU64(st, 11, r.received_chunks);
    BindU64(st, 12, r.first_sequence);
    BindU64(st, 13, r.last_sequence);
    BindU64(st, 14, r.assembly_failures);
    BindBlob(st, 15, r.payload);
    BindU64(st, 16, r.completed_at_ms);
    BindU64(st, 17, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::EventRecord>
SqliteChunkRepository::GetEvent(Transaction& t, const std::string& sensor_id, const std::string& event_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kEventColumns + " FROM events WHERE sensor_id=? AND event_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, sensor_id);
    BindText(st, 2, event_id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadEvent(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::EventRecord> SqliteChunkRepository::ListLatestCompleteEvents(Transaction& t) {
    auto* db = TX(t).Handle();

    // one row per sensor: the complete event with the highest last_sequence
    const std::string sql =
        std::string("SELECT ") + kEventColumns + " FROM events e WHERE e.state=1 AND e.last_sequence = "
        "(SELECT MAX(last_sequence) FROM events i WHERE i.sensor_id=e.sensor_id AND i.state=1) "
        "ORDER BY e.sensor_id ASC;";

    std::vector<model::EventRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        auto r = ReadEvent(st);
        if (!out.empty() && out.back().sensor_id == r.sensor_id) continue;
        out.push_back(std::move(r));
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<model::EventRecord> SqliteChunkRepository::ListEventsUpdatedBefore(Transaction& t, uint64_t cutoff_ms) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kEventColumns +
                            " FROM events WHERE updated_at_ms<? ORDER BY sensor_id ASC, last_sequence ASC;";

    std::vector<model::EventRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindU64(st, 1, cutoff_ms);

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadEvent(st));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteChunkRepository::DeleteEvent(Transaction& t, const std::string& sensor_id, const std::string& event_id) {
    auto* db = TX(t).Handle();

    for (const char* sql : {"DELETE FROM chunks WHERE sensor_id=? AND event_id=?;",
                            "DELETE FROM events WHERE sensor_id=? AND event_id=?;"}) {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        BindText(st, 1, sensor_id);
        BindText(st, 2, event_id);

        int rc = sqlite3_step(st);
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
    }

    return Result::Ok();
}

// ------------------------------------------------------------------
// Offsets
// ------------------------------------------------------------------

Result SqliteChunkRepository::UpsertOffset(Transaction& t, const model::SensorOffsetRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO sensor_offsets(sensor_id,committed_sequence,expired_upto,updated_at_ms) VALUES(?,?,?,?) "
        "ON CONFLICT(sensor_id) DO UPDATE SET committed_sequence=excluded.committed_sequence, "
        "expired_upto=excluded.expired_upto, updated_at_ms=excluded.updated_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.sensor_id);
    BindU64(st, 2, r.committed_sequence);
    BindU64(st, 3, r.expired_upto);
    BindU64(st, 4, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::SensorOffsetRecord>
SqliteChunkRepository::GetOffset(Transaction& t, const std::string& sensor_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT sensor_id,committed_sequence,expired_upto,updated_at_ms FROM sensor_offsets WHERE sensor_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, sensor_id);

    if (sqlite3_step(st) != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadOffset(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::SensorOffsetRecord> SqliteChunkRepository::ListOffsets(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT sensor_id,committed_sequence,expired_upto,updated_at_ms FROM sensor_offsets ORDER BY sensor_id ASC;";

    std::vector<model::SensorOffsetRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadOffset(st));
    }

    sqlite3_finalize(st);
    return out;
}

} // namespace sensorlink::db::sqlite
