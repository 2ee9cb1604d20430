#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace bay::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace bay::db::sqlite
