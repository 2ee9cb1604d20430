#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace bay::db::sqlite {

using bay::db::ErrorCode;
using bay::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        return StmtPtr(nullptr, &sqlite3_finalize);
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
    if (v.has_value()) {
        BindU64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    const int   size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColU64(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

constexpr const char* kSandboxColumns =
    "id,owner,profile_id,workspace_id,expires_at_ms,deleted_at_ms,created_at_ms,last_active_at_ms";

model::SandboxRecord ReadSandbox(sqlite3_stmt* st) {
    model::SandboxRecord r;
    r.id                = ColText(st, 0);
    r.owner             = ColText(st, 1);
    r.profile_id        = ColText(st, 2);
    r.workspace_id      = ColText(st, 3);
    r.expires_at_ms     = ColOptU64(st, 4);
    r.deleted_at_ms     = ColOptU64(st, 5);
    r.created_at_ms     = ColU64(st, 6);
    r.last_active_at_ms = ColU64(st, 7);
    return r;
}

constexpr const char* kSessionColumns =
    "id,sandbox_id,profile_id,runtime_type,desired_state,observed_state,instance_id,endpoint,"
    "idle_expires_at_ms,created_at_ms,last_active_at_ms,last_error";

model::SessionRecord ReadSession(sqlite3_stmt* st) {
    model::SessionRecord r;
    r.id                 = ColText(st, 0);
    r.sandbox_id         = ColText(st, 1);
    r.profile_id         = ColText(st, 2);
    r.runtime_type       = ColText(st, 3);
    r.desired_state      = static_cast<bay::v1::SessionState>(ColI32(st, 4));
    r.observed_state     = static_cast<bay::v1::SessionState>(ColI32(st, 5));
    r.instance_id        = ColText(st, 6);
    r.endpoint           = ColText(st, 7);
    r.idle_expires_at_ms = ColOptU64(st, 8);
    r.created_at_ms      = ColU64(st, 9);
    r.last_active_at_ms  = ColU64(st, 10);
    r.last_error         = ColText(st, 11);
    return r;
}

constexpr const char* kWorkspaceColumns =
    "id,owner,volume_name,managed,managed_by_sandbox_id,size_limit_mb,created_at_ms,last_accessed_at_ms";

model::WorkspaceRecord ReadWorkspace(sqlite3_stmt* st) {
    model::WorkspaceRecord r;
    r.id                    = ColText(st, 0);
    r.owner                 = ColText(st, 1);
    r.volume_name           = ColText(st, 2);
    r.managed               = ColI32(st, 3) != 0;
    r.managed_by_sandbox_id = ColText(st, 4);
    r.size_limit_mb         = static_cast<uint32_t>(ColI32(st, 5));
    r.created_at_ms         = ColU64(st, 6);
    r.last_accessed_at_ms   = ColU64(st, 7);
    return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(sqlite3_stmt* st, Reader read) {
    std::vector<Record> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(read(st));
    }
    return out;
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

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Sandboxes
// ------------------------------------------------------------------

Result SqliteRepository::InsertSandbox(Transaction& t, const model::SandboxRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO sandbox(id,owner,profile_id,workspace_id,expires_at_ms,deleted_at_ms,created_at_ms,last_active_at_ms)"
        " VALUES(?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.owner);
    BindText(st.get(), 3, r.profile_id);
    BindText(st.get(), 4, r.workspace_id);
    BindOptU64(st.get(), 5, r.expires_at_ms);
    BindOptU64(st.get(), 6, r.deleted_at_ms);
    BindU64(st.get(), 7, r.created_at_ms);
    BindU64(st.get(), 8, r.last_active_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SandboxRecord> SqliteRepository::GetSandbox(Transaction& t, const std::string& id) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kSandboxColumns + " FROM sandbox WHERE id=?;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadSandbox(st.get());
}

Result SqliteRepository::UpdateSandbox(Transaction& t, const model::SandboxRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE sandbox SET owner=?,profile_id=?,workspace_id=?,expires_at_ms=?,deleted_at_ms=?,last_active_at_ms=?"
        " WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.owner);
    BindText(st.get(), 2, r.profile_id);
    BindText(st.get(), 3, r.workspace_id);
    BindOptU64(st.get(), 4, r.expires_at_ms);
    BindOptU64(st.get(), 5, r.deleted_at_ms);
    BindU64(st.get(), 6, r.last_active_at_ms);
    BindText(st.get(), 7, r.id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "sandbox not found: " + r.id);
    return Translate(db, rc);
}

std::vector<model::SandboxRecord> SqliteRepository::ListSandboxes(Transaction& t, const SandboxPage& page) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kSandboxColumns +
               " FROM sandbox WHERE owner=? AND deleted_at_ms IS NULL AND id>? ORDER BY id LIMIT ?;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return {};

    BindText(st.get(), 1, page.owner);
    BindText(st.get(), 2, page.after_id);
    BindU64(st.get(), 3, page.limit);
    return ReadAll<model::SandboxRecord>(st.get(), ReadSandbox);
}

std::vector<model::SandboxRecord> SqliteRepository::ListExpiredSandboxes(Transaction& t, uint64_t now_ms) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kSandboxColumns +
               " FROM sandbox WHERE deleted_at_ms IS NULL AND expires_at_ms IS NOT NULL AND expires_at_ms<? ORDER BY id;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return {};

    BindU64(st.get(), 1, now_ms);
    return ReadAll<model::SandboxRecord>(st.get(), ReadSandbox);
}

uint64_t SqliteRepository::CountWorkspaceReferences(Transaction& t, const std::string& workspace_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT COUNT(*) FROM sandbox WHERE workspace_id=? AND deleted_at_ms IS NULL;");
    if (!st) return 0;

    BindText(st.get(), 1, workspace_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
    return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
    auto* db = TX(t).Handle();

    // UNIQUE(sandbox_id) keeps at most one session per sandbox
    auto st = Prepare(db,
        "INSERT INTO session(id,sandbox_id,profile_id,runtime_type,desired_state,observed_state,instance_id,endpoint,"
        "idle_expires_at_ms,created_at_ms,last_active_at_ms,last_error) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.sandbox_id);
    BindText(st.get(), 3, r.profile_id);
    BindText(st.get(), 4, r.runtime_type);
    BindI32(st.get(), 5, static_cast<int>(r.desired_state));
    BindI32(st.get(), 6, static_cast<int>(r.observed_state));
    BindText(st.get(), 7, r.instance_id);
    BindText(st.get(), 8, r.endpoint);
    BindOptU64(st.get(), 9, r.idle_expires_at_ms);
    BindU64(st.get(), 10, r.created_at_ms);
    BindU64(st.get(), 11, r.last_active_at_ms);
    BindText(st.get(), 12, r.last_error);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kSessionColumns + " FROM session WHERE id=?;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadSession(st.get());
}

std::optional<model::SessionRecord> SqliteRepository::GetSessionBySandbox(Transaction& t, const std::string& sandbox_id) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kSessionColumns + " FROM session WHERE sandbox_id=?;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, sandbox_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadSession(st.get());
}

std::vector<model::SessionRecord> SqliteRepository::ListSessions(Transaction& t) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kSessionColumns + " FROM session ORDER BY id;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return {};
    return ReadAll<model::SessionRecord>(st.get(), ReadSession);
}

std::vector<model::SessionRecord> SqliteRepository::ListIdleSessions(Transaction& t, uint64_t now_ms) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kSessionColumns +
               " FROM session WHERE observed_state=? AND idle_expires_at_ms IS NOT NULL AND idle_expires_at_ms<? ORDER BY id;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return {};

    BindI32(st.get(), 1, static_cast<int>(bay::v1::SESSION_STATE_RUNNING));
    BindU64(st.get(), 2, now_ms);
    return ReadAll<model::SessionRecord>(st.get(), ReadSession);
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "UPDATE session SET desired_state=?,observed_state=?,instance_id=?,endpoint=?,idle_expires_at_ms=?,"
        "last_active_at_ms=?,last_error=? WHERE id=? AND sandbox_id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(st.get(), 1, static_cast<int>(r.desired_state));
    BindI32(st.get(), 2, static_cast<int>(r.observed_state));
    BindText(st.get(), 3, r.instance_id);
    BindText(st.get(), 4, r.endpoint);
    BindOptU64(st.get(), 5, r.idle_expires_at_ms);
    BindU64(st.get(), 6, r.last_active_at_ms);
    BindText(st.get(), 7, r.last_error);
    BindText(st.get(), 8, r.id);
    BindText(st.get(), 9, r.sandbox_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "session not found: " + r.id);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteSession(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM session WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Workspaces
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorkspace(Transaction& t, const model::WorkspaceRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO workspace(id,owner,volume_name,managed,managed_by_sandbox_id,size_limit_mb,created_at_ms,last_accessed_at_ms)"
        " VALUES(?,?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.owner);
    BindText(st.get(), 3, r.volume_name);
    BindI32(st.get(), 4, r.managed ? 1 : 0);
    BindText(st.get(), 5, r.managed_by_sandbox_id);
    BindI32(st.get(), 6, static_cast<int>(r.size_limit_mb));
    BindU64(st.get(), 7, r.created_at_ms);
    BindU64(st.get(), 8, r.last_accessed_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::WorkspaceRecord> SqliteRepository::GetWorkspace(Transaction& t, const std::string& id) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kWorkspaceColumns + " FROM workspace WHERE id=?;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return std::nullopt;

    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    return ReadWorkspace(st.get());
}

std::vector<model::WorkspaceRecord> SqliteRepository::ListWorkspaces(Transaction& t) {
    auto* db  = TX(t).Handle();
    auto  sql = std::string("SELECT ") + kWorkspaceColumns + " FROM workspace ORDER BY id;";

    auto st = Prepare(db, sql.c_str());
    if (!st) return {};
    return ReadAll<model::WorkspaceRecord>(st.get(), ReadWorkspace);
}

Result SqliteRepository::DeleteWorkspace(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM workspace WHERE id=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

Result SqliteRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO idempotency_key(owner,key,fingerprint,response_snapshot,status_code,created_at_ms,expires_at_ms)"
        " VALUES(?,?,?,?,?,?,?);");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.owner);
    BindText(st.get(), 2, r.key);
    BindText(st.get(), 3, r.fingerprint);
    BindBlob(st.get(), 4, r.response_snapshot);
    BindI32(st.get(), 5, r.status_code);
    BindU64(st.get(), 6, r.created_at_ms);
    BindU64(st.get(), 7, r.expires_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::IdempotencyRecord> SqliteRepository::GetIdempotency(Transaction& t, const std::string& owner, const std::string& key) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT owner,key,fingerprint,response_snapshot,status_code,created_at_ms,expires_at_ms"
        " FROM idempotency_key WHERE owner=? AND key=?;");
    if (!st) return std::nullopt;

    BindText(st.get(), 1, owner);
    BindText(st.get(), 2, key);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

    model::IdempotencyRecord r;
    r.owner             = ColText(st.get(), 0);
    r.key               = ColText(st.get(), 1);
    r.fingerprint       = ColText(st.get(), 2);
    r.response_snapshot = ColBlob(st.get(), 3);
    r.status_code       = ColI32(st.get(), 4);
    r.created_at_ms     = ColU64(st.get(), 5);
    r.expires_at_ms     = ColU64(st.get(), 6);
    return r;
}

Result SqliteRepository::DeleteIdempotency(Transaction& t, const std::string& owner, const std::string& key) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM idempotency_key WHERE owner=? AND key=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, owner);
    BindText(st.get(), 2, key);
    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteExpiredIdempotency(Transaction& t, uint64_t now_ms, uint64_t* deleted) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM idempotency_key WHERE expires_at_ms<=?;");
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st.get(), 1, now_ms);
    int rc = sqlite3_step(st.get());
    if (deleted && rc == SQLITE_DONE) *deleted = static_cast<uint64_t>(sqlite3_changes(db));
    return Translate(db, rc);
}

} // namespace bay::db::sqlite
