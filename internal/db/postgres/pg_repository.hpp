#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace bay::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace bay::db::postgres
