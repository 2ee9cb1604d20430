#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/idempotency_record.hpp"
#include "internal/db/model/sandbox_record.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/db/model/workspace_record.hpp"

namespace bay::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Insert* returns AlreadyExists on a duplicate key, never overwrites
  - At most one session row exists per sandbox

  The DB is the source of truth for:
    sandboxes
    sessions
    workspaces
    idempotency records
*/

struct SandboxPage {
  std::string owner;
  std::string after_id; // exclusive cursor
  uint32_t    limit = 50;
};

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Sandboxes
  // ---------------------------------------------------------------------

  virtual Result InsertSandbox(Transaction&, const model::SandboxRecord&) = 0;

  // Returns soft-deleted rows too; callers decide visibility.
  virtual std::optional<model::SandboxRecord> GetSandbox(Transaction&, const std::string& id) = 0;

  virtual Result UpdateSandbox(Transaction&, const model::SandboxRecord&) = 0;

  // Live (not soft-deleted) sandboxes of one owner ordered by id.
  virtual std::vector<model::SandboxRecord> ListSandboxes(Transaction&, const SandboxPage& page) = 0;

  // Live sandboxes with expires_at < now.
  virtual std::vector<model::SandboxRecord> ListExpiredSandboxes(Transaction&, uint64_t now_ms) = 0;

  // Live sandboxes referencing the workspace.
  virtual uint64_t CountWorkspaceReferences(Transaction&, const std::string& workspace_id) = 0;

  // ---------------------------------------------------------------------
  // Sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::SessionRecord&) = 0;

  virtual std::optional<model::SessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::SessionRecord> GetSessionBySandbox(Transaction&, const std::string& sandbox_id) = 0;

  virtual std::vector<model::SessionRecord> ListSessions(Transaction&) = 0;

  // Running sessions with idle_expires_at < now.
  virtual std::vector<model::SessionRecord> ListIdleSessions(Transaction&, uint64_t now_ms) = 0;

  virtual Result UpdateSession(Transaction&, const model::SessionRecord&) = 0;

  virtual Result DeleteSession(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Workspaces
  // ---------------------------------------------------------------------

  virtual Result InsertWorkspace(Transaction&, const model::WorkspaceRecord&) = 0;

  virtual std::optional<model::WorkspaceRecord> GetWorkspace(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::WorkspaceRecord> ListWorkspaces(Transaction&) = 0;

  virtual Result DeleteWorkspace(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Idempotency ledger
  // ---------------------------------------------------------------------

  virtual Result InsertIdempotency(Transaction&, const model::IdempotencyRecord&) = 0;

  virtual std::optional<model::IdempotencyRecord> GetIdempotency(Transaction&, const std::string& owner, const std::string& key) = 0;

  virtual Result DeleteIdempotency(Transaction&, const std::string& owner, const std::string& key) = 0;

  // Bulk delete of rows with expires_at <= now. Reports the number removed.
  virtual Result DeleteExpiredIdempotency(Transaction&, uint64_t now_ms, uint64_t* deleted) = 0;
};

} // namespace bay::db
