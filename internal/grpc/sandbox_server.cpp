#include "sandbox_server.hpp"

#include "grpc_error.hpp"

namespace bay::grpc {

std::string OwnerOf(const ::grpc::ServerContext* context) {
  if (!context) {
    return kDefaultOwner;
  }
  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find(kOwnerMetadataKey);
  if (it == metadata.end() || it->second.empty()) {
    return kDefaultOwner;
  }
  return std::string(it->second.data(), it->second.size());
}

SandboxServer::SandboxServer(std::shared_ptr<bay::service::SandboxService> svc) : service_(std::move(svc)) {
}

::grpc::Status SandboxServer::CreateSandbox(::grpc::ServerContext* ctx, const bay::v1::CreateSandboxRequest* req,
                                            bay::v1::CreateSandboxResponse* resp) {
  try {
    *resp = service_->Create(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::GetSandbox(::grpc::ServerContext* ctx, const bay::v1::GetSandboxRequest* req, bay::v1::GetSandboxResponse* resp) {
  try {
    *resp = service_->Get(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::ListSandboxes(::grpc::ServerContext* ctx, const bay::v1::ListSandboxesRequest* req,
                                            bay::v1::ListSandboxesResponse* resp) {
  try {
    *resp = service_->List(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::Keepalive(::grpc::ServerContext* ctx, const bay::v1::KeepaliveRequest* req, bay::v1::KeepaliveResponse*) {
  try {
    service_->Keepalive(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::StopSandbox(::grpc::ServerContext* ctx, const bay::v1::StopSandboxRequest* req, bay::v1::StopSandboxResponse*) {
  try {
    service_->Stop(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::DeleteSandbox(::grpc::ServerContext* ctx, const bay::v1::DeleteSandboxRequest* req, bay::v1::DeleteSandboxResponse*) {
  try {
    service_->Delete(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::ExtendTtl(::grpc::ServerContext* ctx, const bay::v1::ExtendTtlRequest* req, bay::v1::ExtendTtlResponse* resp) {
  try {
    *resp = service_->ExtendTtl(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::ResolveCapability(::grpc::ServerContext* ctx, const bay::v1::ResolveCapabilityRequest* req,
                                                bay::v1::ResolveCapabilityResponse* resp) {
  try {
    *resp = service_->ResolveCapability(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::CreateWorkspace(::grpc::ServerContext* ctx, const bay::v1::CreateWorkspaceRequest* req,
                                              bay::v1::CreateWorkspaceResponse* resp) {
  try {
    *resp = service_->CreateWorkspace(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SandboxServer::DeleteWorkspace(::grpc::ServerContext* ctx, const bay::v1::DeleteWorkspaceRequest* req,
                                              bay::v1::DeleteWorkspaceResponse*) {
  try {
    service_->DeleteWorkspace(OwnerOf(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace bay::grpc
