#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"

namespace permit::db::sqlite {

using permit::db::ErrorCode;
using permit::db::Result;

namespace {

// Finalizes on scope exit.
struct Statement {
    sqlite3_stmt* st = nullptr;

    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) st = nullptr;
    }
    ~Statement() {
        if (st) sqlite3_finalize(st);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    explicit operator bool() const { return st != nullptr; }
};

// Read paths have no Result to carry an engine error; they throw like SqliteDB::Exec.
[[noreturn]] void ThrowSqlite(sqlite3* db, const std::string& what) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v) BindI64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

void BindDirective(sqlite3_stmt* st, int idx, model::MergeDirective d) {
    const auto value = model::ToOptional(d);
    if (value) sqlite3_bind_int(st, idx, *value ? 1 : 0);
    else sqlite3_bind_null(st, idx);
}

// Column accessors check the column index and SQL NULL before touching
// engine-owned memory; NULL comes back as std::nullopt.
bool ValidColumn(sqlite3_stmt* st, int col) {
    return col >= 0 && col < sqlite3_column_count(st);
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (!ValidColumn(st, col) || sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    const unsigned char* t = sqlite3_column_text(st, col);
    const int            n = sqlite3_column_bytes(st, col);
    if (!t) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(n));
}

std::string ColText(sqlite3_stmt* st, int col) {
    return ColOptText(st, col).value_or(std::string());
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
    if (!ValidColumn(st, col) || sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::MergeDirective ColDirective(sqlite3_stmt* st, int col) {
    const auto v = ColOptI64(st, col);
    if (!v) return model::MergeDirective::kUnspecified;
    return model::FromOptional(*v != 0);
}

model::PermissionChange ReadRow(sqlite3_stmt* st) {
    model::PermissionChange r;
    r.id             = ColText(st, 0);
    r.created_at     = util::FromUnixMillis(ColOptI64(st, 1).value_or(0));
    r.updated_at     = util::FromUnixMillis(ColOptI64(st, 2).value_or(0));
    if (auto code = ColOptI64(st, 3)) r.status_code = static_cast<int32_t>(*code);
    r.status_message = ColOptText(st, 4);
    r.user_id        = ColText(st, 5);
    r.metadata_key   = ColOptText(st, 6);
    r.metadata_value = ColOptText(st, 7);
    r.realm_url      = ColText(st, 8);
    r.may_read       = ColDirective(st, 9);
    r.may_write      = ColDirective(st, 10);
    r.may_manage     = ColDirective(st, 11);
    return r;
}

} // namespace

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

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Permission change
// ------------------------------------------------------------------

Result SqliteRepository::InsertPermissionChange(Transaction& t, const model::PermissionChange& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_PERMISSION_CHANGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, r.id);
    BindI64(st.st, 2, util::ToUnixMillis(r.created_at));
    BindI64(st.st, 3, util::ToUnixMillis(r.updated_at));
    BindOptI64(st.st, 4, r.status_code ? std::optional<int64_t>(*r.status_code) : std::nullopt);
    BindOptText(st.st, 5, r.status_message);
    BindText(st.st, 6, r.user_id);
    BindOptText(st.st, 7, r.metadata_key);
    BindOptText(st.st, 8, r.metadata_value);
    BindText(st.st, 9, r.realm_url);
    BindDirective(st.st, 10, r.may_read);
    BindDirective(st.st, 11, r.may_write);
    BindDirective(st.st, 12, r.may_manage);

    return Translate(db, sqlite3_step(st.st));
}

std::optional<model::PermissionChange>
SqliteRepository::GetPermissionChange(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_PERMISSION_CHANGE);
    if (!st) ThrowSqlite(db, "prepare select permission change");

    BindText(st.st, 1, id);

    const int rc = sqlite3_step(st.st);
    if (rc == SQLITE_ROW) return ReadRow(st.st);
    if (rc == SQLITE_DONE) return std::nullopt;
    ThrowSqlite(db, "select permission change " + id);
}

std::vector<model::PermissionChange>
SqliteRepository::ListPermissionChanges(Transaction& t, const PermissionChangeFilter& filter) {
    auto* db = TX(t).Handle();
    std::vector<model::PermissionChange> out;

    Statement st(db, sql::LIST_PERMISSION_CHANGES);
    if (!st) ThrowSqlite(db, "prepare list permission changes");

    int status = 0;
    switch (filter.status) {
        case StatusFilter::kAll: status = 0; break;
        case StatusFilter::kPending: status = 1; break;
        case StatusFilter::kProcessed: status = 2; break;
    }
    sqlite3_bind_int(st.st, 1, status);
    BindOptText(st.st, 2, filter.realm_url);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.st)) == SQLITE_ROW) {
        out.push_back(ReadRow(st.st));
    }
    // A partial list would hide pending requests from Resume().
    if (rc != SQLITE_DONE) ThrowSqlite(db, "list permission changes");
    return out;
}

Result SqliteRepository::SetStatus(Transaction& t, const StatusWrite& w) {
    auto* db = TX(t).Handle();

    {
        Statement st(db, sql::SET_STATUS);
        if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

        sqlite3_bind_int(st.st, 1, w.status_code);
        BindText(st.st, 2, w.status_message);
        BindOptI64(st.st, 3, w.updated_at ? std::optional<int64_t>(util::ToUnixMillis(*w.updated_at)) : std::nullopt);
        BindText(st.st, 4, w.id);

        auto result = Translate(db, sqlite3_step(st.st));
        if (!result) return result;
        if (sqlite3_changes(db) > 0) return Result::Ok();
    }

    Statement exists(db, sql::EXISTS_PERMISSION_CHANGE);
    if (!exists) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(exists.st, 1, w.id);

    const int rc = sqlite3_step(exists.st);
    if (rc == SQLITE_ROW)
        return Result::Err(ErrorCode::Conflict, "status already set for " + w.id);
    if (rc == SQLITE_DONE)
        return Result::Err(ErrorCode::NotFound, "permission change " + w.id);
    return Translate(db, rc);
}

Result SqliteRepository::DeletePermissionChange(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_PERMISSION_CHANGE);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.st, 1, id);
    return Translate(db, sqlite3_step(st.st));
}

} // namespace permit::db::sqlite
