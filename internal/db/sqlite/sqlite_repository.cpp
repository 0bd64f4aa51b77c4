#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace durable::db::sqlite {

using durable::db::ErrorCode;
using durable::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
    sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    int n = sqlite3_column_bytes(st, col);
    return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(n)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static model::CheckpointRecord ReadCheckpoint(sqlite3_stmt* st) {
    model::CheckpointRecord r;
    r.run_id = ColText(st, 0);
    r.value = ColBlob(st, 1);
    r.errored = sqlite3_column_int(st, 2) != 0;
    r.updated_at_ms = ColU64(st, 3);
    return r;
}

static model::AppendOnlyRecord ReadRecord(sqlite3_stmt* st) {
    model::AppendOnlyRecord r;
    r.store = ColText(st, 0);
    r.key = ColText(st, 1);
    r.value = ColBlob(st, 2);
    r.created_at_ms = ColU64(st, 3);
    return r;
}

[[noreturn]] static void ThrowRead(sqlite3* db, const char* what) {
    throw util::StorageUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Checkpoints
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_CHECKPOINT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.run_id);
    BindBlob(st.get(), 2, r.value);
    sqlite3_bind_int(st.get(), 3, r.errored ? 1 : 0);
    BindU64(st.get(), 4, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteCheckpoint(Transaction& t, const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_CHECKPOINT);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, run_id);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CheckpointRecord>
SqliteRepository::GetCheckpoint(Transaction& t, const std::string& run_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_CHECKPOINT);
    if (!st) ThrowRead(db, "select checkpoint");

    BindText(st.get(), 1, run_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowRead(db, "select checkpoint");

    return ReadCheckpoint(st.get());
}

std::vector<model::CheckpointRecord> SqliteRepository::ListCheckpoints(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_ALL_CHECKPOINTS);
    if (!st) ThrowRead(db, "list checkpoints");

    std::vector<model::CheckpointRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadCheckpoint(st.get()));
    }
    if (rc != SQLITE_DONE) ThrowRead(db, "list checkpoints");

    return out;
}

// ------------------------------------------------------------------
// Append-only records
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecord(Transaction& t, const model::AppendOnlyRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_RECORD);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.store);
    BindText(st.get(), 2, r.key);
    BindBlob(st.get(), 3, r.value);
    BindU64(st.get(), 4, r.created_at_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    // ON CONFLICT DO NOTHING: zero rows changed means the key exists
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
}

std::optional<model::AppendOnlyRecord>
SqliteRepository::GetRecord(Transaction& t, const std::string& store, const std::string& key) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_RECORD);
    if (!st) ThrowRead(db, "select record");

    BindText(st.get(), 1, store);
    BindText(st.get(), 2, key);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowRead(db, "select record");

    return ReadRecord(st.get());
}

std::vector<model::AppendOnlyRecord>
SqliteRepository::ListRecords(Transaction& t, const std::string& store) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_RECORDS_IN_STORE);
    if (!st) ThrowRead(db, "list records");

    BindText(st.get(), 1, store);

    std::vector<model::AppendOnlyRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadRecord(st.get()));
    }
    if (rc != SQLITE_DONE) ThrowRead(db, "list records");

    return out;
}

} // namespace durable::db::sqlite
