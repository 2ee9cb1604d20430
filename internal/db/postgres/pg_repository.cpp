#include "pg_repository.hpp"

namespace bay::db::postgres {

namespace {

// Response snapshots are binary protobuf; stored hex-encoded in a TEXT column.
std::string HexEncode(const std::string& in) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(in.size() * 2);
  for (unsigned char c : in) {
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

std::string HexDecode(const std::string& in) {
  auto nibble = [](char c) -> int { return c <= '9' ? c - '0' : c - 'a' + 10; };
  std::string out;
  out.reserve(in.size() / 2);
  for (size_t i = 0; i + 1 < in.size(); i += 2) {
    out.push_back(static_cast<char>((nibble(in[i]) << 4) | nibble(in[i + 1])));
  }
  return out;
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

constexpr const char* kSandboxColumns =
    "id,owner,profile_id,workspace_id,expires_at_ms,deleted_at_ms,created_at_ms,last_active_at_ms";

model::SandboxRecord ReadSandbox(const pqxx::row& row) {
  model::SandboxRecord r;
  r.id                = Text(row[0]);
  r.owner             = Text(row[1]);
  r.profile_id        = Text(row[2]);
  r.workspace_id      = Text(row[3]);
  r.expires_at_ms     = OptU64(row[4]);
  r.deleted_at_ms     = OptU64(row[5]);
  r.created_at_ms     = row[6].as<uint64_t>();
  r.last_active_at_ms = row[7].as<uint64_t>();
  return r;
}

constexpr const char* kSessionColumns =
    "id,sandbox_id,profile_id,runtime_type,desired_state,observed_state,instance_id,endpoint,"
    "idle_expires_at_ms,created_at_ms,last_active_at_ms,last_error";

model::SessionRecord ReadSession(const pqxx::row& row) {
  model::SessionRecord r;
  r.id                 = Text(row[0]);
  r.sandbox_id         = Text(row[1]);
  r.profile_id         = Text(row[2]);
  r.runtime_type       = Text(row[3]);
  r.desired_state      = static_cast<bay::v1::SessionState>(row[4].as<int>());
  r.observed_state     = static_cast<bay::v1::SessionState>(row[5].as<int>());
  r.instance_id        = Text(row[6]);
  r.endpoint           = Text(row[7]);
  r.idle_expires_at_ms = OptU64(row[8]);
  r.created_at_ms      = row[9].as<uint64_t>();
  r.last_active_at_ms  = row[10].as<uint64_t>();
  r.last_error         = Text(row[11]);
  return r;
}

constexpr const char* kWorkspaceColumns =
    "id,owner,volume_name,managed,managed_by_sandbox_id,size_limit_mb,created_at_ms,last_accessed_at_ms";

model::WorkspaceRecord ReadWorkspace(const pqxx::row& row) {
  model::WorkspaceRecord r;
  r.id                    = Text(row[0]);
  r.owner                 = Text(row[1]);
  r.volume_name           = Text(row[2]);
  r.managed               = row[3].as<bool>();
  r.managed_by_sandbox_id = Text(row[4]);
  r.size_limit_mb         = row[5].as<uint32_t>();
  r.created_at_ms         = row[6].as<uint64_t>();
  r.last_accessed_at_ms   = row[7].as<uint64_t>();
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(const pqxx::result& res, Reader read) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Sandboxes
// ------------------------------------------------------------------

Result PgRepository::InsertSandbox(Transaction& t, const model::SandboxRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_sandbox", r.id, r.owner, r.profile_id, r.workspace_id, r.expires_at_ms, r.deleted_at_ms,
                                          r.created_at_ms, r.last_active_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "sandbox exists: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SandboxRecord> PgRepository::GetSandbox(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_sandbox", id);
  if (res.empty()) return std::nullopt;
  return ReadSandbox(res[0]);
}

Result PgRepository::UpdateSandbox(Transaction& t, const model::SandboxRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_sandbox", r.id, r.owner, r.profile_id, r.workspace_id, r.expires_at_ms, r.deleted_at_ms,
                                          r.last_active_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "sandbox not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SandboxRecord> PgRepository::ListSandboxes(Transaction& t, const SandboxPage& page) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSandboxColumns +
                                          " FROM sandbox WHERE owner=$1 AND deleted_at_ms IS NULL AND id>$2 ORDER BY id LIMIT $3;",
                                      page.owner, page.after_id, page.limit);
  return ReadAll<model::SandboxRecord>(res, ReadSandbox);
}

std::vector<model::SandboxRecord> PgRepository::ListExpiredSandboxes(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSandboxColumns +
                                          " FROM sandbox WHERE deleted_at_ms IS NULL AND expires_at_ms IS NOT NULL AND expires_at_ms<$1 ORDER BY id;",
                                      now_ms);
  return ReadAll<model::SandboxRecord>(res, ReadSandbox);
}

uint64_t PgRepository::CountWorkspaceReferences(Transaction& t, const std::string& workspace_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM sandbox WHERE workspace_id=$1 AND deleted_at_ms IS NULL;", workspace_id);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

Result PgRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  try {
    // A unique violation would abort the whole transaction; conflicts surface as zero rows instead.
    auto res = TX(t).Work().exec_params(
        "INSERT INTO session(id,sandbox_id,profile_id,runtime_type,desired_state,observed_state,instance_id,endpoint,"
        "idle_expires_at_ms,created_at_ms,last_active_at_ms,last_error) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) ON CONFLICT DO NOTHING;",
        r.id, r.sandbox_id, r.profile_id, r.runtime_type, static_cast<int>(r.desired_state), static_cast<int>(r.observed_state), r.instance_id,
        r.endpoint, r.idle_expires_at_ms, r.created_at_ms, r.last_active_at_ms, r.last_error);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "session or sandbox session exists: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SessionRecord> PgRepository::GetSession(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSessionColumns + " FROM session WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

std::optional<model::SessionRecord> PgRepository::GetSessionBySandbox(Transaction& t, const std::string& sandbox_id) {
  auto res = TX(t).Work().exec_prepared("get_session_by_sandbox", sandbox_id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

std::vector<model::SessionRecord> PgRepository::ListSessions(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kSessionColumns + " FROM session ORDER BY id;");
  return ReadAll<model::SessionRecord>(res, ReadSession);
}

std::vector<model::SessionRecord> PgRepository::ListIdleSessions(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kSessionColumns +
          " FROM session WHERE observed_state=$1 AND idle_expires_at_ms IS NOT NULL AND idle_expires_at_ms<$2 ORDER BY id;",
      static_cast<int>(bay::v1::SESSION_STATE_RUNNING), now_ms);
  return ReadAll<model::SessionRecord>(res, ReadSession);
}

Result PgRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE session SET desired_state=$3,observed_state=$4,instance_id=$5,endpoint=$6,idle_expires_at_ms=$7,"
        "last_active_at_ms=$8,last_error=$9 WHERE id=$1 AND sandbox_id=$2;",
        r.id, r.sandbox_id, static_cast<int>(r.desired_state), static_cast<int>(r.observed_state), r.instance_id, r.endpoint,
        r.idle_expires_at_ms, r.last_active_at_ms, r.last_error);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "session not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSession(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM session WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Workspaces
// ------------------------------------------------------------------

Result PgRepository::InsertWorkspace(Transaction& t, const model::WorkspaceRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO workspace(id,owner,volume_name,managed,managed_by_sandbox_id,size_limit_mb,created_at_ms,last_accessed_at_ms)"
        " VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT DO NOTHING;",
        r.id, r.owner, r.volume_name, r.managed, r.managed_by_sandbox_id, r.size_limit_mb, r.created_at_ms, r.last_accessed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "workspace exists: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkspaceRecord> PgRepository::GetWorkspace(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kWorkspaceColumns + " FROM workspace WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadWorkspace(res[0]);
}

std::vector<model::WorkspaceRecord> PgRepository::ListWorkspaces(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kWorkspaceColumns + " FROM workspace ORDER BY id;");
  return ReadAll<model::WorkspaceRecord>(res, ReadWorkspace);
}

Result PgRepository::DeleteWorkspace(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM workspace WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------------

Result PgRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_idempotency", r.owner, r.key, r.fingerprint, HexEncode(r.response_snapshot), r.status_code,
                                          r.created_at_ms, r.expires_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "idempotency key exists: " + r.key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::IdempotencyRecord> PgRepository::GetIdempotency(Transaction& t, const std::string& owner, const std::string& key) {
  auto res = TX(t).Work().exec_prepared("get_idempotency", owner, key);
  if (res.empty()) return std::nullopt;

  model::IdempotencyRecord r;
  r.owner             = Text(res[0][0]);
  r.key               = Text(res[0][1]);
  r.fingerprint       = Text(res[0][2]);
  r.response_snapshot = HexDecode(Text(res[0][3]));
  r.status_code       = res[0][4].as<int32_t>();
  r.created_at_ms     = res[0][5].as<uint64_t>();
  r.expires_at_ms     = res[0][6].as<uint64_t>();
  return r;
}

Result PgRepository::DeleteIdempotency(Transaction& t, const std::string& owner, const std::string& key) {
  try {
    TX(t).Work().exec_params("DELETE FROM idempotency_key WHERE owner=$1 AND key=$2;", owner, key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredIdempotency(Transaction& t, uint64_t now_ms, uint64_t* deleted) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM idempotency_key WHERE expires_at_ms<=$1;", now_ms);
    if (deleted) *deleted = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace bay::db::postgres
