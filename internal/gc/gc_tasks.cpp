#include "internal/gc/gc_tasks.hpp"

#include <unordered_map>
#include <utility>

#include "internal/model/state_machine.hpp"

namespace bay::gc {

ExpiredSandboxGc::ExpiredSandboxGc(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::SandboxManager> manager,
                                   core::RetryPolicy item_retry, util::NowFn now)
    : GcTask(item_retry), repository_(std::move(repository)), manager_(std::move(manager)), now_(std::move(now)) {
}

void ExpiredSandboxGc::Collect(GcResult& result) {
  std::vector<db::model::SandboxRecord> expired;
  {
    auto tx = repository_->Begin();
    expired = repository_->ListExpiredSandboxes(*tx, util::ToUnixMillis(now_()));
    tx->Commit();
  }

  for (const auto& sandbox : expired) {
    Item(result, sandbox.id, [&] { return manager_->ReclaimExpired(sandbox.id); });
  }
}

IdleSessionGc::IdleSessionGc(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::SandboxManager> manager,
                             core::RetryPolicy item_retry, util::NowFn now)
    : GcTask(item_retry), repository_(std::move(repository)), manager_(std::move(manager)), now_(std::move(now)) {
}

void IdleSessionGc::Collect(GcResult& result) {
  std::vector<db::model::SessionRecord> idle;
  {
    auto tx = repository_->Begin();
    idle    = repository_->ListIdleSessions(*tx, util::ToUnixMillis(now_()));
    tx->Commit();
  }

  for (const auto& session : idle) {
    Item(result, session.id, [&] { return manager_->ReclaimIdleSession(session.sandbox_id); });
  }
}

StaleSessionGc::StaleSessionGc(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::SandboxManager> manager,
                               core::RetryPolicy item_retry)
    : GcTask(item_retry), repository_(std::move(repository)), manager_(std::move(manager)) {
}

void StaleSessionGc::Collect(GcResult& result) {
  std::vector<db::model::SessionRecord> starting;
  {
    auto tx = repository_->Begin();
    for (auto& session : repository_->ListSessions(*tx)) {
      if (session.observed_state == bay::v1::SESSION_STATE_PENDING || session.observed_state == bay::v1::SESSION_STATE_STARTING) {
        starting.push_back(std::move(session));
      }
    }
    tx->Commit();
  }

  // age is judged by the manager under the sandbox's section
  for (const auto& session : starting) {
    Item(result, session.id, [&] { return manager_->ReclaimStaleStart(session.sandbox_id); });
  }
}

OrphanWorkspaceGc::OrphanWorkspaceGc(std::shared_ptr<core::WorkspaceManager> workspaces, bool include_external, core::RetryPolicy item_retry)
    : GcTask(item_retry), workspaces_(std::move(workspaces)), include_external_(include_external) {
}

void OrphanWorkspaceGc::Collect(GcResult& result) {
  for (const auto& workspace : workspaces_->ListOrphans(include_external_)) {
    Item(result, workspace.id, [&] { return workspaces_->ReclaimIfOrphan(workspace, include_external_); });
  }
}

OrphanInstanceGc::OrphanInstanceGc(std::shared_ptr<db::Repository> repository, std::shared_ptr<driver::ComputeDriver> driver,
                                   std::string tag_namespace, core::RetryPolicy item_retry)
    : GcTask(item_retry), repository_(std::move(repository)), driver_(std::move(driver)), tag_namespace_(std::move(tag_namespace)) {
}

void OrphanInstanceGc::Collect(GcResult& result) {
  const auto instances = driver_->ListInstances({{driver::kManagedByLabel, tag_namespace_}});

  std::unordered_map<std::string, db::model::SessionRecord> sessions;
  {
    auto tx = repository_->Begin();
    for (auto& session : repository_->ListSessions(*tx)) {
      auto id = session.id;
      sessions.emplace(std::move(id), std::move(session));
    }
    tx->Commit();
  }

  for (const auto& instance : instances) {
    auto label = instance.labels.find(driver::kSessionLabel);
    if (label != instance.labels.end()) {
      auto it = sessions.find(label->second);
      // A pending session has not recorded its instance id yet.
      if (it != sessions.end() && model::IsLiveSession(it->second.observed_state) &&
          (it->second.instance_id.empty() || it->second.instance_id == instance.instance_id)) {
        continue;
      }
    }

    Item(result, instance.instance_id, [&] {
      driver_->Destroy(instance.instance_id);
      return true;
    });
  }
}

ExpiredIdempotencyGc::ExpiredIdempotencyGc(std::shared_ptr<idempotency::IdempotencyLedger> ledger)
    : GcTask(core::RetryPolicy{}), ledger_(std::move(ledger)) {
}

void ExpiredIdempotencyGc::Collect(GcResult& result) {
  result.cleaned += ledger_->PurgeExpired();
}

} // namespace bay::gc
