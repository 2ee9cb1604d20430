#include "internal/adapter/grpc_runtime_adapter.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/util/errors.hpp"

namespace bay::adapter {

GrpcRuntimeAdapter::GrpcRuntimeAdapter(std::string endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)),
      timeout_(timeout),
      stub_(bay::v1::RuntimeService::NewStub(::grpc::CreateChannel(endpoint_, ::grpc::InsecureChannelCredentials()))) {
}

bool GrpcRuntimeAdapter::Healthy() {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout_);

  bay::v1::HealthRequest  request;
  bay::v1::HealthResponse response;
  auto                    status = stub_->Health(&context, request, &response);
  return status.ok() && response.healthy();
}

RuntimeMeta GrpcRuntimeAdapter::FetchMeta() {
  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout_);

  bay::v1::GetMetaRequest  request;
  bay::v1::GetMetaResponse response;
  auto                     status = stub_->GetMeta(&context, request, &response);
  if (!status.ok()) {
    throw util::DriverError("runtime meta at " + endpoint_ + " failed: " + status.error_message());
  }

  RuntimeMeta meta;
  meta.runtime_type = response.runtime_type();
  meta.version      = response.version();
  meta.capabilities.assign(response.capabilities().begin(), response.capabilities().end());
  return meta;
}

} // namespace bay::adapter
