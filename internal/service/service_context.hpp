#pragma once

#include <memory>

namespace bay::core {
class SandboxManager;
class WorkspaceManager;
} // namespace bay::core
namespace bay::idempotency {
class IdempotencyLedger;
}

namespace bay::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<bay::core::SandboxManager>            manager;
  std::shared_ptr<bay::core::WorkspaceManager>          workspaces;
  std::shared_ptr<bay::idempotency::IdempotencyLedger> ledger;
};

} // namespace bay::service
