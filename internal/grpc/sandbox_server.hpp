#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "bay/v1.hpp"
#include "internal/service/sandbox_service.hpp"

namespace bay::grpc {

// Metadata key naming the calling owner; absent means "default".
inline constexpr const char* kOwnerMetadataKey = "x-bay-owner";
inline constexpr const char* kDefaultOwner     = "default";

std::string OwnerOf(const ::grpc::ServerContext* context);

class SandboxServer final : public bay::v1::SandboxService::Service {
 public:
  explicit SandboxServer(std::shared_ptr<bay::service::SandboxService> svc);

  ::grpc::Status CreateSandbox(::grpc::ServerContext*, const bay::v1::CreateSandboxRequest*, bay::v1::CreateSandboxResponse*) override;

  ::grpc::Status GetSandbox(::grpc::ServerContext*, const bay::v1::GetSandboxRequest*, bay::v1::GetSandboxResponse*) override;

  ::grpc::Status ListSandboxes(::grpc::ServerContext*, const bay::v1::ListSandboxesRequest*, bay::v1::ListSandboxesResponse*) override;

  ::grpc::Status Keepalive(::grpc::ServerContext*, const bay::v1::KeepaliveRequest*, bay::v1::KeepaliveResponse*) override;

  ::grpc::Status StopSandbox(::grpc::ServerContext*, const bay::v1::StopSandboxRequest*, bay::v1::StopSandboxResponse*) override;

  ::grpc::Status DeleteSandbox(::grpc::ServerContext*, const bay::v1::DeleteSandboxRequest*, bay::v1::DeleteSandboxResponse*) override;

  ::grpc::Status ExtendTtl(::grpc::ServerContext*, const bay::v1::ExtendTtlRequest*, bay::v1::ExtendTtlResponse*) override;

  ::grpc::Status ResolveCapability(::grpc::ServerContext*, const bay::v1::ResolveCapabilityRequest*,
                                   bay::v1::ResolveCapabilityResponse*) override;

  ::grpc::Status CreateWorkspace(::grpc::ServerContext*, const bay::v1::CreateWorkspaceRequest*, bay::v1::CreateWorkspaceResponse*) override;

  ::grpc::Status DeleteWorkspace(::grpc::ServerContext*, const bay::v1::DeleteWorkspaceRequest*, bay::v1::DeleteWorkspaceResponse*) override;

 private:
  std::shared_ptr<bay::service::SandboxService> service_;
};

} // namespace bay::grpc
