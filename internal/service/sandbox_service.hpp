#pragma once

#include <string>

#include "bay/v1.hpp"
#include "service_context.hpp"

namespace bay::service {

/*
  Transport-independent operation surface. Every call is scoped to the
  caller's owner string.
*/
class SandboxService {
 public:
  explicit SandboxService(ServiceContext ctx);

  bay::v1::CreateSandboxResponse Create(const std::string& owner, const bay::v1::CreateSandboxRequest& req);

  bay::v1::GetSandboxResponse Get(const std::string& owner, const bay::v1::GetSandboxRequest& req);

  bay::v1::ListSandboxesResponse List(const std::string& owner, const bay::v1::ListSandboxesRequest& req);

  void Keepalive(const std::string& owner, const bay::v1::KeepaliveRequest& req);

  void Stop(const std::string& owner, const bay::v1::StopSandboxRequest& req);

  void Delete(const std::string& owner, const bay::v1::DeleteSandboxRequest& req);

  bay::v1::ExtendTtlResponse ExtendTtl(const std::string& owner, const bay::v1::ExtendTtlRequest& req);

  // Capability dispatch gate: compute running, capability present.
  bay::v1::ResolveCapabilityResponse ResolveCapability(const std::string& owner, const bay::v1::ResolveCapabilityRequest& req);

  bay::v1::CreateWorkspaceResponse CreateWorkspace(const std::string& owner, const bay::v1::CreateWorkspaceRequest& req);

  void DeleteWorkspace(const std::string& owner, const bay::v1::DeleteWorkspaceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace bay::service
