#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "bay/v1.hpp"
#include "internal/adapter/runtime_adapter.hpp"

namespace bay::adapter {

// Adapter for the "ship" runtime family, which serves RuntimeService over gRPC.
class GrpcRuntimeAdapter final : public RuntimeAdapter {
 public:
  static constexpr const char* kRuntimeType = "ship";

  GrpcRuntimeAdapter(std::string endpoint, std::chrono::milliseconds timeout);

  const std::string& RuntimeType() const override {
    return runtime_type_;
  }
  const std::string& Endpoint() const override {
    return endpoint_;
  }

  bool Healthy() override;

 protected:
  RuntimeMeta FetchMeta() override;

 private:
  std::string                                    runtime_type_{kRuntimeType};
  std::string                                    endpoint_;
  std::chrono::milliseconds                      timeout_;
  std::unique_ptr<bay::v1::RuntimeService::Stub> stub_;
};

} // namespace bay::adapter
