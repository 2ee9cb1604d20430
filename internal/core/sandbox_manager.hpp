#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "bay/v1/types.pb.h"
#include "internal/adapter/runtime_adapter.hpp"
#include "internal/core/profile_registry.hpp"
#include "internal/core/retry_policy.hpp"
#include "internal/core/workspace_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/driver/compute_driver.hpp"
#include "internal/lock/sandbox_lock_table.hpp"
#include "internal/util/time.hpp"

namespace bay::core {

struct SandboxManagerOptions {
  // Bounds both the wait for a busy sandbox and the readiness poll of a fresh instance.
  RetryPolicy readiness{0, std::chrono::milliseconds(500), std::chrono::milliseconds(1000), 2.0, std::chrono::milliseconds(120000)};

  uint32_t             retry_after_ms = 1000;
  std::chrono::seconds max_extend{86400};
  std::string          mount_path    = "/workspace";
  std::string          tag_namespace = "bay";
};

// Running session as seen by capability dispatch.
struct SessionHandle {
  std::string                              session_id;
  std::string                              endpoint;
  std::string                              runtime_type;
  std::shared_ptr<adapter::RuntimeAdapter> adapter;
};

struct SandboxListing {
  std::vector<bay::v1::Sandbox> items;
  std::string                   next_cursor;
};

/*
  Sandbox lifecycle orchestration.

  Every mutation of a sandbox's session (start, stop, delete, reclaim)
  runs inside that sandbox's exclusive section, so at most one compute
  instance is ever started per sandbox. Driver calls are never made while
  a store transaction is open.

  All operations taking an owner resolve sandboxes of other owners, and
  soft-deleted sandboxes, as util::NotFound.
*/
class SandboxManager {
 public:
  SandboxManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<driver::ComputeDriver> driver,
                 std::shared_ptr<const adapter::AdapterRegistry> adapters, std::shared_ptr<const ProfileRegistry> profiles,
                 std::shared_ptr<WorkspaceManager> workspaces, SandboxManagerOptions options, util::NowFn now = util::Now);

  // ttl_seconds == 0 means no hard TTL. An empty workspace_id provisions a managed workspace.
  bay::v1::Sandbox Create(const std::string& owner, const std::string& profile_id, const std::string& workspace_id, int64_t ttl_seconds);

  bay::v1::Sandbox Get(const std::string& owner, const std::string& sandbox_id);

  SandboxListing List(const std::string& owner, std::optional<bay::v1::SandboxStatus> status, uint32_t limit, const std::string& cursor);

  /*
    Returns a running, healthy session, starting one when needed.

    Concurrent callers for one sandbox share a single start: the first
    starts compute, the others wait (bounded by the readiness budget) and
    adopt its session, or its failure.

    Throws:
      SessionNotReady  another start held the sandbox past the budget
      Timeout          the runtime never became healthy
      DriverError      the driver refused to start compute
      SandboxExpired / NotFound
  */
  SessionHandle EnsureRunning(const std::string& owner, const std::string& sandbox_id);

  void Keepalive(const std::string& owner, const std::string& sandbox_id);

  // Destroys compute, keeps the sandbox and its workspace. Idempotent.
  void Stop(const std::string& owner, const std::string& sandbox_id);

  void Delete(const std::string& owner, const std::string& sandbox_id);

  bay::v1::Sandbox ExtendTtl(const std::string& owner, const std::string& sandbox_id, int64_t extend_by_seconds);

  // ---------------------------------------------------------------------
  // Reconciliation entry points (not owner scoped). Each returns false
  // when the sandbox was busy or no longer qualified, and is skipped.
  // ---------------------------------------------------------------------

  bool ReclaimExpired(const std::string& sandbox_id);

  bool ReclaimIdleSession(const std::string& sandbox_id);

  /*
    Clears a session stuck in PENDING or STARTING for longer than the
    readiness timeout, destroying whatever instance it recorded. Such a
    session is left behind when the process dies mid-start; a start still
    in flight holds the section and is skipped.
  */
  bool ReclaimStaleStart(const std::string& sandbox_id);

 private:
  using Guard = lock::SandboxLockTable::Guard;

  lock::SandboxLockTable::Guard Enter(const std::string& sandbox_id, const char* operation);

  db::model::SandboxRecord LoadVisible(db::Transaction& tx, const std::string& owner, const std::string& sandbox_id, const char* operation);
  void                     ThrowIfExpired(const db::model::SandboxRecord& sandbox, uint64_t now_ms, const char* operation) const;

  SessionHandle StartSession(Guard& guard, const db::model::SandboxRecord& sandbox);
  void          MarkFailed(db::model::SessionRecord session, const std::string& error) noexcept;

  // Destroys the session's instance (if any) and removes its record.
  void TeardownSession(const std::string& sandbox_id);
  void TeardownSession(const db::model::SessionRecord& session);

  // Soft delete plus managed-workspace cascade. Caller holds the section.
  void SoftDelete(const std::string& sandbox_id);

  SessionHandle    HandleFor(const db::model::SessionRecord& session);
  bay::v1::Sandbox ToView(const db::model::SandboxRecord& sandbox, const std::optional<db::model::SessionRecord>& session, uint64_t now_ms) const;

  driver::Labels InstanceLabels(const db::model::SandboxRecord& sandbox, const std::string& session_id) const;
  uint64_t       IdleTimeoutMs(const std::string& profile_id) const;
  uint64_t       NowMs() const;

  std::shared_ptr<db::Repository>                 repository_;
  std::shared_ptr<driver::ComputeDriver>          driver_;
  std::shared_ptr<const adapter::AdapterRegistry> adapters_;
  std::shared_ptr<const ProfileRegistry>          profiles_;
  std::shared_ptr<WorkspaceManager>               workspaces_;
  SandboxManagerOptions                           options_;
  util::NowFn                                     now_;

  lock::SandboxLockTable locks_;

  // Adapters of live sessions, keyed by session id.
  std::mutex                                                               adapters_mutex_;
  std::unordered_map<std::string, std::shared_ptr<adapter::RuntimeAdapter>> session_adapters_;
};

} // namespace bay::core
