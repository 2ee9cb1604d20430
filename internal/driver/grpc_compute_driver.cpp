#include "internal/driver/grpc_compute_driver.hpp"

#include <grpcpp/client_context.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace bay::driver {

namespace {

void ThrowIfFailed(const ::grpc::Status& status, std::string_view action, const std::string& target) {
  if (status.ok()) {
    return;
  }
  throw util::DriverError(std::string(action) + " " + target + " failed: " + status.error_message());
}

// Destructive calls treat "already gone" as success.
void ThrowIfFailedIgnoringNotFound(const ::grpc::Status& status, std::string_view action, const std::string& target) {
  if (status.error_code() == ::grpc::StatusCode::NOT_FOUND) {
    return;
  }
  ThrowIfFailed(status, action, target);
}

} // namespace

GrpcComputeDriver::GrpcComputeDriver(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout)
    : stub_(bay::v1::ComputeDriverService::NewStub(std::move(channel))), timeout_(timeout) {
}

void GrpcComputeDriver::Prepare(::grpc::ClientContext& context) const {
  context.set_deadline(std::chrono::system_clock::now() + timeout_);
}

StartedInstance GrpcComputeDriver::Start(const InstanceRequest& request) {
  bay::v1::StartInstanceRequest rpc_request;
  auto*                         spec = rpc_request.mutable_spec();
  spec->set_image(request.profile.image());
  spec->set_cpus(request.profile.cpus());
  spec->set_memory(request.profile.memory());
  spec->set_volume_name(request.volume_name);
  spec->set_mount_path(request.mount_path);
  spec->set_runtime_port(request.profile.runtime_port());
  spec->mutable_env()->insert(request.profile.env().begin(), request.profile.env().end());
  for (const auto& [key, value] : request.labels) {
    (*spec->mutable_labels())[key] = value;
  }

  ::grpc::ClientContext            context;
  bay::v1::StartInstanceResponse response;
  Prepare(context);
  ThrowIfFailed(stub_->StartInstance(&context, rpc_request, &response), "start instance for profile", request.profile.id());

  if (response.instance_id().empty() || response.endpoint().empty()) {
    throw util::DriverError("start instance for profile " + request.profile.id() + " returned no instance or endpoint");
  }
  return {response.instance_id(), response.endpoint()};
}

void GrpcComputeDriver::Stop(const std::string& instance_id) {
  bay::v1::StopInstanceRequest request;
  request.set_instance_id(instance_id);

  ::grpc::ClientContext           context;
  bay::v1::StopInstanceResponse response;
  Prepare(context);
  ThrowIfFailedIgnoringNotFound(stub_->StopInstance(&context, request, &response), "stop instance", instance_id);
}

void GrpcComputeDriver::Destroy(const std::string& instance_id) {
  bay::v1::DestroyInstanceRequest request;
  request.set_instance_id(instance_id);

  ::grpc::ClientContext              context;
  bay::v1::DestroyInstanceResponse response;
  Prepare(context);
  ThrowIfFailedIgnoringNotFound(stub_->DestroyInstance(&context, request, &response), "destroy instance", instance_id);
}

std::vector<InstanceInfo> GrpcComputeDriver::ListInstances(const Labels& label_filter) {
  bay::v1::ListInstancesRequest request;
  for (const auto& [key, value] : label_filter) {
    (*request.mutable_label_filter())[key] = value;
  }

  ::grpc::ClientContext            context;
  bay::v1::ListInstancesResponse response;
  Prepare(context);
  ThrowIfFailed(stub_->ListInstances(&context, request, &response), "list instances", "");

  std::vector<InstanceInfo> instances;
  instances.reserve(response.instances_size());
  for (const auto& summary : response.instances()) {
    InstanceInfo info;
    info.instance_id = summary.instance_id();
    info.labels.insert(summary.labels().begin(), summary.labels().end());
    instances.push_back(std::move(info));
  }
  return instances;
}

void GrpcComputeDriver::CreateVolume(const std::string& name, const Labels& labels, uint32_t size_limit_mb) {
  bay::v1::CreateVolumeRequest request;
  request.set_name(name);
  request.set_size_limit_mb(size_limit_mb);
  for (const auto& [key, value] : labels) {
    (*request.mutable_labels())[key] = value;
  }

  ::grpc::ClientContext           context;
  bay::v1::CreateVolumeResponse response;
  Prepare(context);
  ThrowIfFailed(stub_->CreateVolume(&context, request, &response), "create volume", name);
}

void GrpcComputeDriver::DeleteVolume(const std::string& name) {
  bay::v1::DeleteVolumeRequest request;
  request.set_name(name);

  ::grpc::ClientContext           context;
  bay::v1::DeleteVolumeResponse response;
  Prepare(context);
  ThrowIfFailedIgnoringNotFound(stub_->DeleteVolume(&context, request, &response), "delete volume", name);
}

} // namespace bay::driver
