#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace cdn::db::sqlite {

using cdn::db::ErrorCode;
using cdn::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColU64(st, col);
}

// column order matches SELECT_ORIGIN(S)
static model::OriginRecord ReadOrigin(sqlite3_stmt* st) {
    model::OriginRecord r;
    r.id            = ColI64(st, 0);
    r.name          = ColText(st, 1);
    r.origin_url    = ColText(st, 2);
    r.cdn_url       = ColText(st, 3);
    r.provider      = ColText(st, 4);
    r.status        = ColText(st, 5);
    r.cache_ttl     = ColI64(st, 6);
    r.notes         = ColText(st, 7);
    r.created_at_ms = ColU64(st, 8);
    r.last_purge_ms = ColOptU64(st, 9);
    return r;
}

static model::CacheRuleRecord ReadCacheRule(sqlite3_stmt* st) {
    model::CacheRuleRecord r;
    r.id            = ColI64(st, 0);
    r.origin_id     = ColI64(st, 1);
    r.path_pattern  = ColText(st, 2);
    r.ttl           = ColI64(st, 3);
    r.cache_headers = sqlite3_column_int(st, 4) != 0;
    r.rule_type     = ColText(st, 5);
    r.created_at_ms = ColU64(st, 6);
    return r;
}

static model::PurgeEventRecord ReadPurgeEvent(sqlite3_stmt* st) {
    model::PurgeEventRecord r;
    r.id            = ColI64(st, 0);
    r.origin_id     = ColI64(st, 1);
    r.purge_type    = ColText(st, 2);
    r.target        = ColText(st, 3);
    r.status        = ColText(st, 4);
    r.triggered_by  = ColText(st, 5);
    r.created_at_ms = ColU64(st, 6);
    return r;
}

// Steps a statement to completion collecting rows; read errors throw.
template <typename Reader>
static auto Collect(sqlite3* db, sqlite3_stmt* st, Reader reader) {
    std::vector<decltype(reader(st))> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(reader(st));
    }
    ThrowIfError(rc, db, "sqlite step");
    return out;
}

static uint64_t ScalarCount(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        ThrowIfError(rc, db, "sqlite count");
        return 0;
    }
    return ColU64(st, 0);
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

    switch (rc) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
        default:
            break;
    }

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Origins
// ------------------------------------------------------------------

Result SqliteRepository::InsertOrigin(Transaction& t, model::OriginRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_ORIGIN, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, r.name);
    BindText(raw, 2, r.origin_url);
    BindText(raw, 3, r.cdn_url);
    BindText(raw, 4, r.provider);
    BindText(raw, 5, r.status);
    BindI64(raw, 6, r.cache_ttl);
    BindText(raw, 7, r.notes);
    BindU64(raw, 8, r.created_at_ms);

    auto result = Translate(db, sqlite3_step(raw));
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::OriginRecord>
SqliteRepository::GetOrigin(Transaction& t, int64_t id) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::SELECT_ORIGIN);

    BindI64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowIfError(rc, tx.Handle(), "sqlite get origin");

    return ReadOrigin(st.get());
}

std::vector<model::OriginRecord>
SqliteRepository::ListOrigins(Transaction& t, const std::optional<std::string>& provider) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(provider ? sql::SELECT_ORIGINS_BY_PROVIDER : sql::SELECT_ORIGINS);
    if (provider) BindText(st.get(), 1, *provider);

    return Collect(tx.Handle(), st.get(), ReadOrigin);
}

Result SqliteRepository::UpdateOriginLastPurge(Transaction& t, int64_t id, uint64_t last_purge_ms) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_ORIGIN_LAST_PURGE, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindU64(raw, 1, last_purge_ms);
    BindI64(raw, 2, id);

    auto result = Translate(db, sqlite3_step(raw));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "origin " + std::to_string(id) + " not found");
    return result;
}

Result SqliteRepository::UpdateOriginStatus(Transaction& t, int64_t id, const std::string& status) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_ORIGIN_STATUS, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindText(raw, 1, status);
    BindI64(raw, 2, id);

    auto result = Translate(db, sqlite3_step(raw));
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "origin " + std::to_string(id) + " not found");
    return result;
}

// ------------------------------------------------------------------
// Cache rules
// ------------------------------------------------------------------

Result SqliteRepository::InsertCacheRule(Transaction& t, model::CacheRuleRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_CACHE_RULE, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindI64(raw, 1, r.origin_id);
    BindText(raw, 2, r.path_pattern);
    BindI64(raw, 3, r.ttl);
    sqlite3_bind_int(raw, 4, r.cache_headers ? 1 : 0);
    BindText(raw, 5, r.rule_type);
    BindU64(raw, 6, r.created_at_ms);

    auto result = Translate(db, sqlite3_step(raw));
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::vector<model::CacheRuleRecord>
SqliteRepository::ListCacheRules(Transaction& t, std::optional<int64_t> origin_id) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(origin_id ? sql::SELECT_CACHE_RULES_BY_ORIGIN : sql::SELECT_CACHE_RULES);
    if (origin_id) BindI64(st.get(), 1, *origin_id);

    return Collect(tx.Handle(), st.get(), ReadCacheRule);
}

uint64_t SqliteRepository::CountCacheRules(Transaction& t) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::COUNT_CACHE_RULES);
    return ScalarCount(tx.Handle(), st.get());
}

// ------------------------------------------------------------------
// Purge events
// ------------------------------------------------------------------

Result SqliteRepository::InsertPurgeEvent(Transaction& t, model::PurgeEventRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_PURGE_EVENT, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Statement st(raw);

    BindI64(raw, 1, r.origin_id);
    BindText(raw, 2, r.purge_type);
    BindText(raw, 3, r.target);
    BindText(raw, 4, r.status);
    BindText(raw, 5, r.triggered_by);
    BindU64(raw, 6, r.created_at_ms);

    auto result = Translate(db, sqlite3_step(raw));
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::vector<model::PurgeEventRecord>
SqliteRepository::ListRecentPurgeEvents(Transaction& t, uint64_t limit) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(sql::SELECT_RECENT_PURGE_EVENTS);
    BindU64(st.get(), 1, limit);

    return Collect(tx.Handle(), st.get(), ReadPurgeEvent);
}

uint64_t SqliteRepository::CountPurgeEvents(Transaction& t, std::optional<uint64_t> created_after_ms) {
    auto& tx = TX(t);
    auto  st = tx.DB().Prepare(created_after_ms ? sql::COUNT_PURGE_EVENTS_SINCE : sql::COUNT_PURGE_EVENTS);
    if (created_after_ms) BindU64(st.get(), 1, *created_after_ms);

    return ScalarCount(tx.Handle(), st.get());
}

}
