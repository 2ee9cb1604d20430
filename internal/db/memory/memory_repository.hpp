#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace bay::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSandbox(Transaction&, const model::SandboxRecord&) override;
  std::optional<model::SandboxRecord> GetSandbox(Transaction&, const std::string&) override;
  Result UpdateSandbox(Transaction&, const model::SandboxRecord&) override;
  std::vector<model::SandboxRecord> ListSandboxes(Transaction&, const SandboxPage&) override;
  std::vector<model::SandboxRecord> ListExpiredSandboxes(Transaction&, uint64_t now_ms) override;
  uint64_t CountWorkspaceReferences(Transaction&, const std::string& workspace_id) override;

  Result InsertSession(Transaction&, const model::SessionRecord&) override;
  std::optional<model::SessionRecord> GetSession(Transaction&, const std::string&) override;
  std::optional<model::SessionRecord> GetSessionBySandbox(Transaction&, const std::string&) override;
  std::vector<model::SessionRecord> ListSessions(Transaction&) override;
  std::vector<model::SessionRecord> ListIdleSessions(Transaction&, uint64_t now_ms) override;
  Result UpdateSession(Transaction&, const model::SessionRecord&) override;
  Result DeleteSession(Transaction&, const std::string&) override;

  Result InsertWorkspace(Transaction&, const model::WorkspaceRecord&) override;
  std::optional<model::WorkspaceRecord> GetWorkspace(Transaction&, const std::string&) override;
  std::vector<model::WorkspaceRecord> ListWorkspaces(Transaction&) override;
  Result DeleteWorkspace(Transaction&, const std::string&) override;

  Result InsertIdempotency(Transaction&, const model::IdempotencyRecord&) override;
  std::optional<model::IdempotencyRecord> GetIdempotency(Transaction&, const std::string& owner, const std::string& key) override;
  Result DeleteIdempotency(Transaction&, const std::string& owner, const std::string& key) override;
  Result DeleteExpiredIdempotency(Transaction&, uint64_t now_ms, uint64_t* deleted) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::SandboxRecord>             sandboxes;
    std::unordered_map<std::string, model::SessionRecord>   sessions;
    std::unordered_map<std::string, std::string>            session_by_sandbox;
    std::unordered_map<std::string, model::WorkspaceRecord> workspaces;
    std::map<std::pair<std::string, std::string>, model::IdempotencyRecord> idempotency;
  };

  std::mutex mutex_;    // guards committed_
  std::mutex tx_mutex_; // held by the single open transaction
  State committed_;
};

}
