#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/state_machine.hpp"
#include "memory_tx.hpp"

namespace bay::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Sandboxes
// ------------------------------------------------------------

Result MemoryRepository::InsertSandbox(Transaction& t, const model::SandboxRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sandboxes.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "sandbox exists: " + r.id);
  s.sandboxes[r.id] = r;
  return Result::Ok();
}

std::optional<model::SandboxRecord> MemoryRepository::GetSandbox(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sandboxes.find(id);
  if (it == s.sandboxes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateSandbox(Transaction& t, const model::SandboxRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.sandboxes.contains(r.id)) return Result::Err(ErrorCode::NotFound, "sandbox not found: " + r.id);
  s.sandboxes[r.id] = r;
  return Result::Ok();
}

std::vector<model::SandboxRecord> MemoryRepository::ListSandboxes(Transaction& t, const SandboxPage& page) {
  const auto&                       s = TX(t).View();
  std::vector<model::SandboxRecord> records;

  auto it = page.after_id.empty() ? s.sandboxes.begin() : s.sandboxes.upper_bound(page.after_id);
  for (; it != s.sandboxes.end() && records.size() < page.limit; ++it) {
    const auto& record = it->second;
    if (record.owner != page.owner || record.deleted_at_ms.has_value()) continue;
    records.push_back(record);
  }
  return records;
}

std::vector<model::SandboxRecord> MemoryRepository::ListExpiredSandboxes(Transaction& t, uint64_t now_ms) {
  const auto&                       s = TX(t).View();
  std::vector<model::SandboxRecord> records;
  for (const auto& [_, record] : s.sandboxes) {
    if (!record.deleted_at_ms.has_value() && bay::model::HasExpired(record.expires_at_ms, now_ms)) {
      records.push_back(record);
    }
  }
  return records;
}

uint64_t MemoryRepository::CountWorkspaceReferences(Transaction& t, const std::string& workspace_id) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.sandboxes.begin(), s.sandboxes.end(), [&](const auto& entry) {
    return entry.second.workspace_id == workspace_id && !entry.second.deleted_at_ms.has_value();
  }));
}

// ------------------------------------------------------------
// Sessions
// ------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::SessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "session exists: " + r.id);
  if (s.session_by_sandbox.contains(r.sandbox_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "sandbox already has a session: " + r.sandbox_id);
  }
  s.sessions[r.id]                   = r;
  s.session_by_sandbox[r.sandbox_id] = r.id;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::SessionRecord> MemoryRepository::GetSessionBySandbox(Transaction& t, const std::string& sandbox_id) {
  const auto& s  = TX(t).View();
  auto        it = s.session_by_sandbox.find(sandbox_id);
  if (it == s.session_by_sandbox.end()) return std::nullopt;
  return s.sessions.at(it->second);
}

std::vector<model::SessionRecord> MemoryRepository::ListSessions(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  records.reserve(s.sessions.size());
  for (const auto& [_, record] : s.sessions) {
    records.push_back(record);
  }
  return records;
}

std::vector<model::SessionRecord> MemoryRepository::ListIdleSessions(Transaction& t, uint64_t now_ms) {
  const auto&                       s = TX(t).View();
  std::vector<model::SessionRecord> records;
  for (const auto& [_, record] : s.sessions) {
    if (record.observed_state == bay::v1::SESSION_STATE_RUNNING && record.idle_expires_at_ms.has_value() && *record.idle_expires_at_ms < now_ms) {
      records.push_back(record);
    }
  }
  return records;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::SessionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.id);
  if (it == s.sessions.end()) return Result::Err(ErrorCode::NotFound, "session not found: " + r.id);
  if (it->second.sandbox_id != r.sandbox_id) return Result::Err(ErrorCode::ConstraintViolation, "session sandbox is immutable");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSession(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(id);
  if (it == s.sessions.end()) return Result::Ok();
  s.session_by_sandbox.erase(it->second.sandbox_id);
  s.sessions.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------
// Workspaces
// ------------------------------------------------------------

Result MemoryRepository::InsertWorkspace(Transaction& t, const model::WorkspaceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.workspaces.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "workspace exists: " + r.id);
  s.workspaces[r.id] = r;
  return Result::Ok();
}

std::optional<model::WorkspaceRecord> MemoryRepository::GetWorkspace(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.workspaces.find(id);
  if (it == s.workspaces.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkspaceRecord> MemoryRepository::ListWorkspaces(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<model::WorkspaceRecord> records;
  records.reserve(s.workspaces.size());
  for (const auto& [_, record] : s.workspaces) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::DeleteWorkspace(Transaction& t, const std::string& id) {
  TX(t).Mutable().workspaces.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------
// Idempotency
// ------------------------------------------------------------

Result MemoryRepository::InsertIdempotency(Transaction& t, const model::IdempotencyRecord& r) {
  auto& s   = TX(t).Mutable();
  auto  key = std::make_pair(r.owner, r.key);
  if (s.idempotency.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "idempotency key exists: " + r.key);
  s.idempotency[key] = r;
  return Result::Ok();
}

std::optional<model::IdempotencyRecord> MemoryRepository::GetIdempotency(Transaction& t, const std::string& owner, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.idempotency.find(std::make_pair(owner, key));
  if (it == s.idempotency.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteIdempotency(Transaction& t, const std::string& owner, const std::string& key) {
  TX(t).Mutable().idempotency.erase(std::make_pair(owner, key));
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredIdempotency(Transaction& t, uint64_t now_ms, uint64_t* deleted) {
  auto&    s     = TX(t).Mutable();
  uint64_t count = std::erase_if(s.idempotency, [&](const auto& entry) { return entry.second.expires_at_ms <= now_ms; });
  if (deleted) *deleted = count;
  return Result::Ok();
}

} // namespace bay::db::memory
