#pragma once

#include <memory>
#include <string>

#include "internal/core/sandbox_manager.hpp"
#include "internal/core/workspace_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/driver/compute_driver.hpp"
#include "internal/gc/gc_task.hpp"
#include "internal/idempotency/idempotency_ledger.hpp"
#include "internal/util/time.hpp"

namespace bay::gc {

// Soft-deletes sandboxes past their hard TTL, destroying compute and managed workspaces.
class ExpiredSandboxGc final : public GcTask {
 public:
  ExpiredSandboxGc(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::SandboxManager> manager, core::RetryPolicy item_retry,
                   util::NowFn now = util::Now);

  const char* Name() const override {
    return "expired_sandbox";
  }

 protected:
  void Collect(GcResult& result) override;

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<core::SandboxManager> manager_;
  util::NowFn                           now_;
};

// Reclaims compute of running sessions past their idle deadline. Sandboxes survive.
class IdleSessionGc final : public GcTask {
 public:
  IdleSessionGc(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::SandboxManager> manager, core::RetryPolicy item_retry,
                util::NowFn now = util::Now);

  const char* Name() const override {
    return "idle_session";
  }

 protected:
  void Collect(GcResult& result) override;

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<core::SandboxManager> manager_;
  util::NowFn                           now_;
};

// Clears sessions abandoned mid-start (process died between insert and RUNNING).
class StaleSessionGc final : public GcTask {
 public:
  StaleSessionGc(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::SandboxManager> manager, core::RetryPolicy item_retry);

  const char* Name() const override {
    return "stale_session";
  }

 protected:
  void Collect(GcResult& result) override;

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<core::SandboxManager> manager_;
};

class OrphanWorkspaceGc final : public GcTask {
 public:
  OrphanWorkspaceGc(std::shared_ptr<core::WorkspaceManager> workspaces, bool include_external, core::RetryPolicy item_retry);

  const char* Name() const override {
    return "orphan_workspace";
  }

 protected:
  void Collect(GcResult& result) override;

 private:
  std::shared_ptr<core::WorkspaceManager> workspaces_;
  bool                                    include_external_;
};

/*
  Destroys driver instances tagged with our namespace that no live session
  record accounts for. Instances are listed before sessions, so an
  instance started during the pass always finds its session.
*/
class OrphanInstanceGc final : public GcTask {
 public:
  OrphanInstanceGc(std::shared_ptr<db::Repository> repository, std::shared_ptr<driver::ComputeDriver> driver, std::string tag_namespace,
                   core::RetryPolicy item_retry);

  const char* Name() const override {
    return "orphan_instance";
  }

 protected:
  void Collect(GcResult& result) override;

 private:
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<driver::ComputeDriver> driver_;
  std::string                            tag_namespace_;
};

// Bulk purge; a failed purge counts as one error.
class ExpiredIdempotencyGc final : public GcTask {
 public:
  explicit ExpiredIdempotencyGc(std::shared_ptr<idempotency::IdempotencyLedger> ledger);

  const char* Name() const override {
    return "expired_idempotency";
  }

 protected:
  void Collect(GcResult& result) override;

 private:
  std::shared_ptr<idempotency::IdempotencyLedger> ledger_;
};

} // namespace bay::gc
