#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>

#include "bay/v1.hpp"
#include "internal/driver/compute_driver.hpp"

namespace bay::driver {

/*
  ComputeDriver backed by a remote ComputeDriverService.

  Every RPC carries a deadline of `timeout`.
*/
class GrpcComputeDriver final : public ComputeDriver {
 public:
  GrpcComputeDriver(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds timeout);

  StartedInstance           Start(const InstanceRequest& request) override;
  void                      Stop(const std::string& instance_id) override;
  void                      Destroy(const std::string& instance_id) override;
  std::vector<InstanceInfo> ListInstances(const Labels& label_filter) override;
  void                      CreateVolume(const std::string& name, const Labels& labels, uint32_t size_limit_mb) override;
  void                      DeleteVolume(const std::string& name) override;

 private:
  void Prepare(::grpc::ClientContext& context) const;

  std::unique_ptr<bay::v1::ComputeDriverService::Stub> stub_;
  std::chrono::milliseconds                            timeout_;
};

} // namespace bay::driver
