#include "sqlite_queue_repository.hpp"

#include <sqlite3.h>

#include "sqlite_bind.hpp"

namespace sensorlink::db::sqlite {

using sensorlink::db::ErrorCode;
using sensorlink::db::Result;

SqliteQueueRepository::SqliteQueueRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteQueueRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteQueueRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Entries
// ------------------------------------------------------------------

Result SqliteQueueRepository::InsertEntries(Transaction& t, const std::vector<model::QueueEntryRecord>& entries) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO queue_entries(sequence,event_id,chunk_index,chunk_count,payload_bytes,chunk,enqueued_at_ms,attempt_count,last_attempt_at_ms) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& e : entries) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);

        BindU64(st, 1, e.sequence);
        BindText(st, 2, e.event_id);
        BindU64(st, 3, e.chunk_index);
        BindU64(st, 4, e.chunk_count);
        BindU64(st, 5, e.payload_bytes);
        BindBlob(st, 6, e.chunk);
        BindU64(st, 7, e.enqueued_at_ms);
        BindU64(st, 8, e.attempt_count);
        BindU64(st, 9, e.last_attempt_at_ms);

        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            sqlite3_finalize(st);
            return result;
        }
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

std::vector<model::QueueEntryRecord>
SqliteQueueRepository::ReadEntriesAfter(Transaction& t, uint64_t after_sequence, uint64_t max_entries) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT sequence,event_id,chunk_index,chunk_count,payload_bytes,chunk,enqueued_at_ms,attempt_count,last_attempt_at_ms "
        "FROM queue_entries WHERE sequence>? ORDER BY sequence ASC LIMIT ?;";

    std::vector<model::QueueEntryRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindU64(st, 1, after_sequence);
    BindU64(st, 2, max_entries);

    while (sqlite3_step(st) == SQLITE_ROW) {
        model::QueueEntryRecord r;
        r.sequence           = ColU64(st, 0);
        r.event_id           = ColText(st, 1);
        r.chunk_index        = ColU32(st, 2);
        r.chunk_count        = ColU32(st, 3);
        r.payload_bytes      = ColU64(st, 4);
        r.chunk              = ColBlob(st, 5);
        r.enqueued_at_ms     = ColU64(st, 6);
        r.attempt_count      = ColU32(st, 7);
        r.last_attempt_at_ms = ColU64(st, 8);
        out.push_back(std::move(r));
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteQueueRepository::DeleteEntriesUpTo(Transaction& t, uint64_t sequence, uint64_t& deleted) {
    auto* db = TX(t).Handle();
    deleted  = 0;

    const char* sql = "DELETE FROM queue_entries WHERE sequence<=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, sequence);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE) deleted = static_cast<uint64_t>(sqlite3_changes(db));
    return Translate(db, rc);
}

Result SqliteQueueRepository::DeleteEntriesOlderThan(Transaction& t, uint64_t cutoff_ms, uint64_t& deleted, uint64_t& max_sequence) {
    auto* db     = TX(t).Handle();
    deleted      = 0;
    max_sequence = 0;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COALESCE(MAX(sequence),0) FROM queue_entries WHERE enqueued_at_ms<?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, cutoff_ms);
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) max_sequence = ColU64(st, 0);
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW) return Translate(db, rc);

    if (sqlite3_prepare_v2(db, "DELETE FROM queue_entries WHERE enqueued_at_ms<?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, cutoff_ms);
    rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE) deleted = static_cast<uint64_t>(sqlite3_changes(db));
    return Translate(db, rc);
}

Result SqliteQueueRepository::RecordAttempt(Transaction& t, const std::vector<uint64_t>& sequences, uint64_t attempt_at_ms) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE queue_entries SET attempt_count=attempt_count+1, last_attempt_at_ms=? WHERE sequence=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (uint64_t sequence : sequences) {
        sqlite3_reset(st);
        BindU64(st, 1, attempt_at_ms);
        BindU64(st, 2, sequence);
        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto result = Translate(db, rc);
            sqlite3_finalize(st);
            return result;
        }
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

uint64_t SqliteQueueRepository::CountEntries(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM queue_entries;", -1, &st, nullptr) != SQLITE_OK)
        return 0;

    uint64_t count = 0;
    if (sqlite3_step(st) == SQLITE_ROW) count = ColU64(st, 0);
    sqlite3_finalize(st);
    return count;
}

std::optional<uint64_t> SqliteQueueRepository::OldestEnqueuedAt(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT MIN(enqueued_at_ms) FROM queue_entries;", -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    std::optional<uint64_t> oldest;
    if (sqlite3_step(st) == SQLITE_ROW && sqlite3_column_type(st, 0) != SQLITE_NULL) {
        oldest = ColU64(st, 0);
    }
    sqlite3_finalize(st);
    return oldest;
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

model::QueueStateRecord SqliteQueueRepository::GetState(Transaction& t) {
    auto* db = TX(t).Handle();

    model::QueueStateRecord r;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT last_sequence,acked_upto,expired_upto FROM queue_state WHERE id=1;", -1, &st, nullptr) != SQLITE_OK)
        return r;

    if (sqlite3_step(st) == SQLITE_ROW) {
        r.last_sequence = ColU64(st, 0);
        r.acked_upto    = ColU64(st, 1);
        r.expired_upto  = ColU64(st, 2);
    }
    sqlite3_finalize(st);
    return r;
}

Result SqliteQueueRepository::PutState(Transaction& t, const model::QueueStateRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO queue_state(id,last_sequence,acked_upto,expired_upto) VALUES(1,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET last_sequence=excluded.last_sequence, acked_upto=excluded.acked_upto, expired_upto=excluded.expired_upto;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.last_sequence);
    BindU64(st, 2, r.acked_upto);
    BindU64(st, 3, r.expired_upto);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

} // namespace sensorlink::db::sqlite
