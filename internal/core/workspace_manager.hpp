#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "bay/v1/types.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/driver/compute_driver.hpp"
#include "internal/lock/sandbox_lock_table.hpp"
#include "internal/util/time.hpp"

namespace bay::core {

struct WorkspaceOptions {
  uint32_t    default_size_limit_mb = 1024;
  std::string tag_namespace         = "bay";
  // Wait for a busy external workspace before giving up with util::Conflict.
  std::chrono::milliseconds lock_timeout{5000};
};

/*
  Workspace volumes and their records.

  Ordering rule for every removal: the driver volume goes first, the
  record second, so a crash in between leaves a record that orphan
  reconciliation can still find.

  An external workspace is bound by sandbox creation and removed by
  DeleteExternal or orphan reconciliation; both sides run inside the
  workspace's section so a binding cannot land between the reference
  check and the removal.
*/
class WorkspaceManager {
 public:
  WorkspaceManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<driver::ComputeDriver> driver, WorkspaceOptions options,
                   util::NowFn now = util::Now);

  // Creates the volume of a managed workspace for `sandbox_id`. The caller inserts the returned record.
  db::model::WorkspaceRecord ProvisionManaged(const std::string& owner, const std::string& sandbox_id);

  bay::v1::Workspace CreateExternal(const std::string& owner, uint32_t size_limit_mb);

  void DeleteExternal(const std::string& owner, const std::string& workspace_id);

  // Exclusive section of one workspace. Throws util::Conflict when it stays busy past lock_timeout.
  lock::SandboxLockTable::Guard EnterWorkspace(const std::string& workspace_id);

  /*
    Deletes the backing volume, then the record. A managed workspace's
    owning sandbox loses its reference in the same transaction.
    Throws util::DriverError when the volume could not be deleted.
  */
  void Reclaim(const db::model::WorkspaceRecord& workspace);

  /*
    Workspaces eligible for reclamation: managed ones whose owning sandbox
    is gone or soft-deleted, and (only with include_external) external ones
    no live sandbox references.
  */
  std::vector<db::model::WorkspaceRecord> ListOrphans(bool include_external);

  // Re-checks eligibility, then reclaims. False when the workspace is no longer an orphan.
  bool ReclaimIfOrphan(const db::model::WorkspaceRecord& workspace, bool include_external);

  // Best-effort volume removal for a volume whose record never made it into the store.
  void DiscardVolume(const std::string& volume_name) noexcept;

  static std::string VolumeNameFor(const std::string& workspace_id);

  static bay::v1::Workspace ToView(const db::model::WorkspaceRecord& record);

 private:
  // Volume, then record. With `require_unreferenced` the record survives (util::Conflict) while a live sandbox binds it.
  void           Remove(const db::model::WorkspaceRecord& workspace, bool require_unreferenced);
  bool           IsOrphan(db::Transaction& tx, const db::model::WorkspaceRecord& workspace, bool include_external);
  driver::Labels VolumeLabels(const std::string& owner, const std::string& workspace_id) const;
  uint64_t       NowMs() const;

  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<driver::ComputeDriver> driver_;
  WorkspaceOptions                       options_;
  util::NowFn                            now_;
  lock::SandboxLockTable                 sections_; // keyed by workspace id
};

} // namespace bay::core
