#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace stash::db::sqlite {

using stash::db::ErrorCode;
using stash::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static void BindBool(sqlite3_stmt* st, int idx, bool v) {
    sqlite3_bind_int(st, idx, v ? 1 : 0);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

// Reads one row in the SELECT column order of sql_queries.hpp.
static model::TaskRecord ReadTask(sqlite3_stmt* st) {
    model::TaskRecord r;
    r.id = ColText(st, 0);
    r.title = ColText(st, 1);
    r.tier = ColText(st, 2);
    r.is_completed = sqlite3_column_int(st, 3) != 0;
    r.created_at = ColDouble(st, 4);
    r.tier_assigned_at = ColDouble(st, 5);
    if (sqlite3_column_type(st, 6) != SQLITE_NULL)
        r.completed_at = ColDouble(st, 6);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
    if (auto writable = CheckWritable(t); !writable)
        return writable;

    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_TASK, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.title);
    BindText(st, 3, r.tier);
    BindBool(st, 4, r.is_completed);
    BindDouble(st, 5, r.created_at);
    BindDouble(st, 6, r.tier_assigned_at);
    if (r.completed_at)
        BindDouble(st, 7, *r.completed_at);
    else
        sqlite3_bind_null(st, 7);

    int rc = sqlite3_step(st);
    // extended codes distinguish a duplicate id from other constraint failures
    if (rc != SQLITE_DONE)
        rc = sqlite3_extended_errcode(db);
    auto result = Translate(db, rc);
    sqlite3_finalize(st);

    return result;
}

Result SqliteRepository::MarkCompleted(Transaction& t, const std::string& id, double completed_at) {
    if (auto writable = CheckWritable(t); !writable)
        return writable;

    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::COMPLETE_TASK, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindDouble(st, 1, completed_at);
    BindText(st, 2, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "no active task " + id);
    return result;
}

Result SqliteRepository::UpdateTier(Transaction& t, const std::string& id, const std::string& tier,
                                    double assigned_at) {
    if (auto writable = CheckWritable(t); !writable)
        return writable;

    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_TIER, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, tier);
    BindDouble(st, 2, assigned_at);
    BindText(st, 3, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "no active task " + id);
    return result;
}

Result SqliteRepository::ExecDelete(Transaction& t, const char* sql) {
    if (auto writable = CheckWritable(t); !writable)
        return writable;

    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteCompleted(Transaction& t) {
    return ExecDelete(t, sql::DELETE_COMPLETED);
}

Result SqliteRepository::DeleteAll(Transaction& t) {
    return ExecDelete(t, sql::DELETE_ALL);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::vector<model::TaskRecord> SqliteRepository::Query(Transaction& t, const char* sql) {
    auto* db = TX(t).Handle();

    std::vector<model::TaskRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW)
        out.push_back(ReadTask(st));

    sqlite3_finalize(st);
    return out;
}

std::vector<model::TaskRecord> SqliteRepository::ListActive(Transaction& t) {
    return Query(t, sql::SELECT_ACTIVE);
}

std::vector<model::TaskRecord> SqliteRepository::ListCompleted(Transaction& t) {
    return Query(t, sql::SELECT_COMPLETED);
}

std::uint64_t SqliteRepository::CountActive(Transaction& t, const std::string& tier) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::COUNT_ACTIVE_IN_TIER, -1, &st, nullptr) != SQLITE_OK)
        return 0;

    BindText(st, 1, tier);

    std::uint64_t count = 0;
    if (sqlite3_step(st) == SQLITE_ROW)
        count = static_cast<std::uint64_t>(sqlite3_column_int64(st, 0));

    sqlite3_finalize(st);
    return count;
}

}
