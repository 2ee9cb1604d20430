#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "bay/v1.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/sandbox_server.hpp"
#include "internal/idempotency/idempotency_ledger.hpp"
#include "internal/service/sandbox_service.hpp"
#include "support/fakes.hpp"

namespace {

using bay::testing::Harness;

struct ServerFixture {
  ServerFixture() {
    auto ledger  = std::make_shared<bay::idempotency::IdempotencyLedger>(h.repository, bay::idempotency::IdempotencyOptions{}, h.clock.Fn());
    auto service = std::make_shared<bay::service::SandboxService>(bay::service::ServiceContext{h.manager, h.workspaces, ledger});
    server       = std::make_unique<bay::grpc::SandboxServer>(service);
  }

  Harness                                   h;
  std::unique_ptr<bay::grpc::SandboxServer> server;
};

bay::v1::ErrorInfo DetailsOf(const ::grpc::Status& status) {
  bay::v1::ErrorInfo info;
  const bool         parsed = info.ParseFromString(status.error_details());
  assert(parsed);
  return info;
}

std::string CreateSandbox(ServerFixture& f, int64_t ttl_seconds) {
  bay::v1::CreateSandboxRequest  req;
  bay::v1::CreateSandboxResponse resp;
  req.set_ttl_seconds(ttl_seconds);
  ::grpc::ServerContext ctx;
  const auto            status = f.server->CreateSandbox(&ctx, &req, &resp);
  assert(status.ok());
  return resp.sandbox().id();
}

void TestGetMissingSandboxReturnsNotFound() {
  ServerFixture f;

  bay::v1::GetSandboxRequest req;
  req.set_sandbox_id("sandbox-000000000000");
  bay::v1::GetSandboxResponse resp;
  ::grpc::ServerContext       ctx;

  const auto status = f.server->GetSandbox(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  const auto info = DetailsOf(status);
  assert(info.code() == "not_found");
  assert(info.sandbox_id() == "sandbox-000000000000");
}

void TestExtendInfiniteTtlReturnsFailedPrecondition() {
  ServerFixture f;
  const auto    id = CreateSandbox(f, 0);

  bay::v1::ExtendTtlRequest req;
  req.set_sandbox_id(id);
  req.set_extend_by_seconds(60);
  bay::v1::ExtendTtlResponse resp;
  ::grpc::ServerContext      ctx;

  const auto status = f.server->ExtendTtl(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(DetailsOf(status).code() == "sandbox_ttl_infinite");
}

void TestInvalidIdempotencyKeyReturnsInvalidArgument() {
  ServerFixture f;

  bay::v1::CreateSandboxRequest req;
  req.set_idempotency_key("spaces are not allowed");
  bay::v1::CreateSandboxResponse resp;
  ::grpc::ServerContext          ctx;

  const auto status = f.server->CreateSandbox(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(DetailsOf(status).code() == "validation_error");
}

void TestUnsupportedCapabilityListsAvailable() {
  ServerFixture f;
  const auto    id = CreateSandbox(f, 0);

  bay::v1::ResolveCapabilityRequest req;
  req.set_sandbox_id(id);
  req.set_capability("browser");
  bay::v1::ResolveCapabilityResponse resp;
  ::grpc::ServerContext              ctx;

  const auto status = f.server->ResolveCapability(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  const auto info = DetailsOf(status);
  assert(info.code() == "capability_not_supported");
  assert(info.capability() == "browser");
  assert(info.available_capabilities_size() == 3);
}

void TestDriverFailureReturnsUnavailable() {
  ServerFixture f;
  const auto    id  = CreateSandbox(f, 0);
  f.h.driver->fail_start = true;

  bay::v1::ResolveCapabilityRequest req;
  req.set_sandbox_id(id);
  req.set_capability("python");
  bay::v1::ResolveCapabilityResponse resp;
  ::grpc::ServerContext              ctx;

  const auto status = f.server->ResolveCapability(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(DetailsOf(status).code() == "driver_error");
}

void TestReferencedWorkspaceDeleteReturnsAborted() {
  ServerFixture f;

  bay::v1::CreateWorkspaceRequest  create;
  bay::v1::CreateWorkspaceResponse created;
  ::grpc::ServerContext            create_ctx;
  const auto                       create_status = f.server->CreateWorkspace(&create_ctx, &create, &created);
  assert(create_status.ok());

  bay::v1::CreateSandboxRequest  sandbox_req;
  bay::v1::CreateSandboxResponse sandbox_resp;
  sandbox_req.set_workspace_id(created.workspace().id());
  ::grpc::ServerContext sandbox_ctx;
  const auto            sandbox_status = f.server->CreateSandbox(&sandbox_ctx, &sandbox_req, &sandbox_resp);
  assert(sandbox_status.ok());

  bay::v1::DeleteWorkspaceRequest  req;
  bay::v1::DeleteWorkspaceResponse resp;
  req.set_workspace_id(created.workspace().id());
  ::grpc::ServerContext ctx;

  const auto status = f.server->DeleteWorkspace(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
  assert(DetailsOf(status).code() == "conflict");
}

void TestErrorMappingTable() {
  using namespace bay::util;

  const auto not_ready = bay::grpc::ToStatus(SessionNotReady("busy", "sandbox-1", 750));
  assert(not_ready.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(DetailsOf(not_ready).retry_after_ms() == 750);

  const auto expired = bay::grpc::ToStatus(SandboxExpired("expired", "sandbox-1", 1'700'000'000'000ULL));
  assert(expired.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(DetailsOf(expired).timestamp().seconds() == 1'700'000'000);

  assert(bay::grpc::ToStatus(Timeout("slow")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(bay::grpc::ToStatus(Conflict("dup")).error_code() == ::grpc::StatusCode::ABORTED);

  const auto internal = bay::grpc::ToStatus(std::runtime_error("boom"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(DetailsOf(internal).code() == "internal");
  assert(internal.error_message() == "boom");
}

void TestOwnerDefaultsWithoutMetadata() {
  ::grpc::ServerContext ctx;
  assert(bay::grpc::OwnerOf(&ctx) == bay::grpc::kDefaultOwner);
}

} // namespace

int main() {
  TestGetMissingSandboxReturnsNotFound();
  TestExtendInfiniteTtlReturnsFailedPrecondition();
  TestInvalidIdempotencyKeyReturnsInvalidArgument();
  TestUnsupportedCapabilityListsAvailable();
  TestDriverFailureReturnsUnavailable();
  TestReferencedWorkspaceDeleteReturnsAborted();
  TestErrorMappingTable();
  TestOwnerDefaultsWithoutMetadata();

  std::cout << "bay_unit_grpc_status: pass\n";
  return 0;
}
