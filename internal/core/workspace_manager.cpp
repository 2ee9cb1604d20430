#include "internal/core/workspace_manager.hpp"

#include <optional>
#include <utility>

#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace bay::core {

using bay::observability::BoolField;
using bay::observability::StringField;

WorkspaceManager::WorkspaceManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<driver::ComputeDriver> driver,
                                   WorkspaceOptions options, util::NowFn now)
    : repository_(std::move(repository)), driver_(std::move(driver)), options_(std::move(options)), now_(std::move(now)) {
  if (!repository_) {
    throw std::invalid_argument("WorkspaceManager: repository is required");
  }
  if (!driver_) {
    throw std::invalid_argument("WorkspaceManager: driver is required");
  }
}

std::string WorkspaceManager::VolumeNameFor(const std::string& workspace_id) {
  return "bay-workspace-" + workspace_id;
}

bay::v1::Workspace WorkspaceManager::ToView(const db::model::WorkspaceRecord& record) {
  bay::v1::Workspace view;
  view.set_id(record.id);
  view.set_managed(record.managed);
  view.set_managed_by_sandbox_id(record.managed_by_sandbox_id);
  view.set_size_limit_mb(record.size_limit_mb);
  *view.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  return view;
}

driver::Labels WorkspaceManager::VolumeLabels(const std::string& owner, const std::string& workspace_id) const {
  return {{driver::kManagedByLabel, options_.tag_namespace}, {driver::kOwnerLabel, owner}, {driver::kWorkspaceLabel, workspace_id}};
}

uint64_t WorkspaceManager::NowMs() const {
  return util::ToUnixMillis(now_());
}

db::model::WorkspaceRecord WorkspaceManager::ProvisionManaged(const std::string& owner, const std::string& sandbox_id) {
  db::model::WorkspaceRecord record;
  record.id                    = util::NewWorkspaceId();
  record.owner                 = owner;
  record.volume_name           = VolumeNameFor(record.id);
  record.managed               = true;
  record.managed_by_sandbox_id = sandbox_id;
  record.size_limit_mb         = options_.default_size_limit_mb;
  record.created_at_ms         = NowMs();
  record.last_accessed_at_ms   = record.created_at_ms;

  auto labels                   = VolumeLabels(owner, record.id);
  labels[driver::kSandboxLabel] = sandbox_id;
  driver_->CreateVolume(record.volume_name, labels, record.size_limit_mb);
  return record;
}

bay::v1::Workspace WorkspaceManager::CreateExternal(const std::string& owner, uint32_t size_limit_mb) {
  db::model::WorkspaceRecord record;
  record.id                  = util::NewWorkspaceId();
  record.owner               = owner;
  record.volume_name         = VolumeNameFor(record.id);
  record.managed             = false;
  record.size_limit_mb       = size_limit_mb > 0 ? size_limit_mb : options_.default_size_limit_mb;
  record.created_at_ms       = NowMs();
  record.last_accessed_at_ms = record.created_at_ms;

  driver_->CreateVolume(record.volume_name, VolumeLabels(owner, record.id), record.size_limit_mb);

  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertWorkspace(*tx, record), "create workspace");
    tx->Commit();
  } catch (const std::exception&) {
    DiscardVolume(record.volume_name);
    throw;
  }

  BAY_LOG_INFO("workspace created", {StringField("workspace_id", record.id), StringField("owner", owner)});
  return ToView(record);
}

lock::SandboxLockTable::Guard WorkspaceManager::EnterWorkspace(const std::string& workspace_id) {
  auto section = sections_.Acquire(workspace_id, options_.lock_timeout);
  if (!section) {
    throw util::Conflict("workspace " + workspace_id + " is busy; retry later");
  }
  return std::move(*section);
}

void WorkspaceManager::DeleteExternal(const std::string& owner, const std::string& workspace_id) {
  {
    auto section = EnterWorkspace(workspace_id);

    db::model::WorkspaceRecord record;
    {
      auto tx        = repository_->Begin();
      auto workspace = repository_->GetWorkspace(*tx, workspace_id);
      if (!workspace || workspace->owner != owner) {
        throw util::NotFound("delete workspace: workspace " + workspace_id + " not found");
      }
      if (workspace->managed) {
        throw util::ValidationError("delete workspace: " + workspace_id + " is managed; delete its sandbox instead");
      }
      const auto references = repository_->CountWorkspaceReferences(*tx, workspace_id);
      if (references > 0) {
        throw util::Conflict("delete workspace: " + workspace_id + " is referenced by " + std::to_string(references) + " live sandbox(es)");
      }
      tx->Commit();
      record = *workspace;
    }

    Remove(record, true);
  }
  sections_.Prune(workspace_id);
}

void WorkspaceManager::Reclaim(const db::model::WorkspaceRecord& workspace) {
  if (!workspace.managed) {
    {
      auto section = EnterWorkspace(workspace.id);
      Remove(workspace, true);
    }
    sections_.Prune(workspace.id);
    return;
  }

  if (!workspace.managed_by_sandbox_id.empty()) {
    auto tx      = repository_->Begin();
    auto sandbox = repository_->GetSandbox(*tx, workspace.managed_by_sandbox_id);
    tx->Commit();
    if (sandbox && !sandbox->deleted_at_ms && sandbox->workspace_id == workspace.id) {
      throw util::Conflict("reclaim workspace: " + workspace.id + " still belongs to live sandbox " + sandbox->id, sandbox->id);
    }
  }
  Remove(workspace, false);
}

void WorkspaceManager::Remove(const db::model::WorkspaceRecord& workspace, bool require_unreferenced) {
  driver_->DeleteVolume(workspace.volume_name);

  auto tx = repository_->Begin();
  if (require_unreferenced) {
    const auto references = repository_->CountWorkspaceReferences(*tx, workspace.id);
    if (references > 0) {
      throw util::Conflict("reclaim workspace: " + workspace.id + " is referenced by " + std::to_string(references) + " live sandbox(es)");
    }
  }
  const bool owned = workspace.managed && !workspace.managed_by_sandbox_id.empty();
  if (owned) {
    auto sandbox = repository_->GetSandbox(*tx, workspace.managed_by_sandbox_id);
    if (sandbox && sandbox->deleted_at_ms && sandbox->workspace_id == workspace.id) {
      sandbox->workspace_id.clear();
      ThrowIfDbError(repository_->UpdateSandbox(*tx, *sandbox), "reclaim workspace: detach sandbox");
    }
  }

  ThrowIfDbError(repository_->DeleteWorkspace(*tx, workspace.id), "reclaim workspace");
  tx->Commit();

  BAY_LOG_INFO("workspace reclaimed", {StringField("workspace_id", workspace.id), StringField("volume", workspace.volume_name),
                                       BoolField("managed", workspace.managed)});
}

bool WorkspaceManager::IsOrphan(db::Transaction& tx, const db::model::WorkspaceRecord& workspace, bool include_external) {
  if (workspace.managed) {
    if (workspace.managed_by_sandbox_id.empty()) {
      return true;
    }
    auto sandbox = repository_->GetSandbox(tx, workspace.managed_by_sandbox_id);
    return !sandbox || sandbox->deleted_at_ms.has_value();
  }
  return include_external && repository_->CountWorkspaceReferences(tx, workspace.id) == 0;
}

std::vector<db::model::WorkspaceRecord> WorkspaceManager::ListOrphans(bool include_external) {
  std::vector<db::model::WorkspaceRecord> orphans;
  auto                                    tx = repository_->Begin();
  for (auto& workspace : repository_->ListWorkspaces(*tx)) {
    if (IsOrphan(*tx, workspace, include_external)) {
      orphans.push_back(std::move(workspace));
    }
  }
  tx->Commit();
  return orphans;
}

bool WorkspaceManager::ReclaimIfOrphan(const db::model::WorkspaceRecord& workspace, bool include_external) {
  // external orphans are only orphans while nothing binds them, so the check and the removal share the section
  auto section = workspace.managed ? std::optional<lock::SandboxLockTable::Guard>{} : sections_.TryAcquire(workspace.id);
  if (!workspace.managed && !section) {
    return false;
  }

  {
    auto tx      = repository_->Begin();
    auto current = repository_->GetWorkspace(*tx, workspace.id);
    const bool orphan = current && IsOrphan(*tx, *current, include_external);
    tx->Commit();
    if (!orphan) {
      return false;
    }
  }

  if (workspace.managed) {
    Reclaim(workspace);
    return true;
  }
  Remove(workspace, true);
  section.reset();
  sections_.Prune(workspace.id);
  return true;
}

void WorkspaceManager::DiscardVolume(const std::string& volume_name) noexcept {
  try {
    driver_->DeleteVolume(volume_name);
  } catch (const std::exception& e) {
    BAY_LOG_WARN("volume cleanup failed; left for orphan reconciliation", {StringField("volume", volume_name), StringField("error", e.what())});
  }
}

} // namespace bay::core
