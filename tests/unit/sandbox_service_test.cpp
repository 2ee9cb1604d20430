#include "internal/service/sandbox_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/sandbox_manager.hpp"
#include "internal/core/workspace_manager.hpp"
#include "internal/idempotency/idempotency_ledger.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using bay::service::SandboxService;
using bay::service::ServiceContext;
using bay::testing::Harness;
using bay::testing::Throws;
using namespace bay::v1;

struct ServiceFixture {
  ServiceFixture() {
    ledger = std::make_shared<bay::idempotency::IdempotencyLedger>(h.repository, bay::idempotency::IdempotencyOptions{}, h.clock.Fn());
    service = std::make_shared<SandboxService>(ServiceContext{h.manager, h.workspaces, ledger});
  }

  Harness                                              h;
  std::shared_ptr<bay::idempotency::IdempotencyLedger> ledger;
  std::shared_ptr<SandboxService>                      service;
};

CreateSandboxRequest CreateRequest(int64_t ttl_seconds, const std::string& key) {
  CreateSandboxRequest req;
  req.set_ttl_seconds(ttl_seconds);
  req.set_idempotency_key(key);
  return req;
}

void TestCreateReplaysWithSameKey() {
  ServiceFixture f;

  const auto first  = f.service->Create("alice", CreateRequest(600, "create-1"));
  const auto second = f.service->Create("alice", CreateRequest(600, "create-1"));
  assert(first.sandbox().id() == second.sandbox().id());
  assert(first.SerializeAsString() == second.SerializeAsString());

  ListSandboxesRequest list;
  assert(f.service->List("alice", list).items_size() == 1);

  // Without a key every call creates.
  f.service->Create("alice", CreateRequest(600, ""));
  f.service->Create("alice", CreateRequest(600, ""));
  assert(f.service->List("alice", list).items_size() == 3);
}

void TestCreateKeyReuseWithDifferentBodyConflicts() {
  ServiceFixture f;
  f.service->Create("alice", CreateRequest(600, "create-1"));
  assert(Throws<bay::util::Conflict>([&] { f.service->Create("alice", CreateRequest(60, "create-1")); }));

  // Keys are per owner.
  const auto bob = f.service->Create("bob", CreateRequest(60, "create-1"));
  assert(!bob.sandbox().id().empty());
}

void TestInvalidIdempotencyKey() {
  ServiceFixture f;
  assert(Throws<bay::util::ValidationError>([&] { f.service->Create("alice", CreateRequest(0, "not a key")); }));
  ListSandboxesRequest list;
  assert(f.service->List("alice", list).items_size() == 0);
}

void TestExtendTtlReplayDoesNotExtendTwice() {
  ServiceFixture f;
  const auto created = f.service->Create("alice", CreateRequest(600, ""));

  ExtendTtlRequest req;
  req.set_sandbox_id(created.sandbox().id());
  req.set_extend_by_seconds(300);
  req.set_idempotency_key("extend-1");

  const auto first  = f.service->ExtendTtl("alice", req);
  const auto second = f.service->ExtendTtl("alice", req);
  assert(first.sandbox().expires_at().seconds() == created.sandbox().expires_at().seconds() + 300);
  assert(second.sandbox().expires_at().seconds() == first.sandbox().expires_at().seconds());

  GetSandboxRequest get;
  get.set_sandbox_id(created.sandbox().id());
  assert(f.service->Get("alice", get).sandbox().expires_at().seconds() == first.sandbox().expires_at().seconds());

  req.set_extend_by_seconds(10);
  assert(Throws<bay::util::Conflict>([&] { f.service->ExtendTtl("alice", req); }));
}

void TestResolveCapability() {
  ServiceFixture f;
  const auto created = f.service->Create("alice", CreateRequest(0, ""));

  ResolveCapabilityRequest req;
  req.set_sandbox_id(created.sandbox().id());
  req.set_capability("python");

  const auto resolved = f.service->ResolveCapability("alice", req);
  assert(!resolved.session_id().empty());
  assert(resolved.endpoint() == "fake://inst-1");
  assert(resolved.runtime_type() == bay::testing::kRuntimeType);

  req.set_capability("gpu");
  bool unsupported = false;
  try {
    f.service->ResolveCapability("alice", req);
  } catch (const bay::util::CapabilityNotSupported& e) {
    unsupported = e.Capability() == "gpu" && e.Available().size() == 3 && e.SandboxId() == created.sandbox().id();
  }
  assert(unsupported);

  req.set_capability("");
  assert(Throws<bay::util::ValidationError>([&] { f.service->ResolveCapability("alice", req); }));

  // One session served every dispatch.
  assert(f.h.driver->Starts() == 1);
}

void TestStopKeepaliveDelete() {
  ServiceFixture f;
  const auto created = f.service->Create("alice", CreateRequest(0, ""));
  const auto id      = created.sandbox().id();

  ResolveCapabilityRequest resolve;
  resolve.set_sandbox_id(id);
  resolve.set_capability("shell");
  f.service->ResolveCapability("alice", resolve);

  KeepaliveRequest keepalive;
  keepalive.set_sandbox_id(id);
  f.service->Keepalive("alice", keepalive);

  StopSandboxRequest stop;
  stop.set_sandbox_id(id);
  f.service->Stop("alice", stop);
  f.service->Stop("alice", stop);

  GetSandboxRequest get;
  get.set_sandbox_id(id);
  assert(f.service->Get("alice", get).sandbox().status() == SANDBOX_STATUS_IDLE);

  ListSandboxesRequest idle_only;
  idle_only.set_status(SANDBOX_STATUS_IDLE);
  assert(f.service->List("alice", idle_only).items_size() == 1);

  DeleteSandboxRequest del;
  del.set_sandbox_id(id);
  f.service->Delete("alice", del);
  assert(Throws<bay::util::NotFound>([&] { f.service->Get("alice", get); }));
  assert(Throws<bay::util::NotFound>([&] { f.service->Delete("alice", del); }));
}

void TestWorkspaceOperations() {
  ServiceFixture f;

  CreateWorkspaceRequest create;
  create.set_size_limit_mb(512);
  const auto workspace = f.service->CreateWorkspace("alice", create).workspace();
  assert(workspace.size_limit_mb() == 512);
  assert(!workspace.managed());

  CreateSandboxRequest sandbox_req;
  sandbox_req.set_workspace_id(workspace.id());
  const auto sandbox = f.service->Create("alice", sandbox_req);

  DeleteWorkspaceRequest del;
  del.set_workspace_id(workspace.id());
  assert(Throws<bay::util::Conflict>([&] { f.service->DeleteWorkspace("alice", del); }));

  DeleteSandboxRequest del_sandbox;
  del_sandbox.set_sandbox_id(sandbox.sandbox().id());
  f.service->Delete("alice", del_sandbox);
  f.service->DeleteWorkspace("alice", del);
  assert(Throws<bay::util::NotFound>([&] { f.service->DeleteWorkspace("alice", del); }));
}

} // namespace

int main() {
  TestCreateReplaysWithSameKey();
  TestCreateKeyReuseWithDifferentBodyConflicts();
  TestInvalidIdempotencyKey();
  TestExtendTtlReplayDoesNotExtendTwice();
  TestResolveCapability();
  TestStopKeepaliveDelete();
  TestWorkspaceOperations();

  std::cout << "bay_unit_sandbox_service: pass\n";
  return 0;
}
