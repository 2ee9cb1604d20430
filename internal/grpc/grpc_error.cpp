#include "grpc_error.hpp"

#include "internal/util/time.hpp"

namespace bay::grpc {

namespace {

::grpc::StatusCode CodeFor(const std::exception& e) {
  using namespace bay::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return ::grpc::StatusCode::NOT_FOUND;
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return ::grpc::StatusCode::ABORTED;
  }
  if (dynamic_cast<const SandboxExpired*>(&e) || dynamic_cast<const SandboxTtlInfinite*>(&e) || dynamic_cast<const CapabilityNotSupported*>(&e)) {
    return ::grpc::StatusCode::FAILED_PRECONDITION;
  }
  if (dynamic_cast<const SessionNotReady*>(&e) || dynamic_cast<const DriverError*>(&e)) {
    return ::grpc::StatusCode::UNAVAILABLE;
  }
  if (dynamic_cast<const Timeout*>(&e)) {
    return ::grpc::StatusCode::DEADLINE_EXCEEDED;
  }
  if (dynamic_cast<const ValidationError*>(&e)) {
    return ::grpc::StatusCode::INVALID_ARGUMENT;
  }

  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

bay::v1::ErrorInfo ToErrorInfo(const std::exception& e) {
  using namespace bay::util;

  bay::v1::ErrorInfo info;
  info.set_message(e.what());
  *info.mutable_timestamp() = ToProto(Now());

  const auto* error = dynamic_cast<const Error*>(&e);
  if (!error) {
    info.set_code("internal");
    return info;
  }

  info.set_code(error->Code());
  info.set_sandbox_id(error->SandboxId());
  if (const auto* not_ready = dynamic_cast<const SessionNotReady*>(&e)) {
    info.set_retry_after_ms(not_ready->RetryAfterMs());
  }
  if (const auto* expired = dynamic_cast<const SandboxExpired*>(&e)) {
    *info.mutable_timestamp() = MillisToProto(expired->ExpiresAtMs());
  }
  if (const auto* unsupported = dynamic_cast<const CapabilityNotSupported*>(&e)) {
    info.set_capability(unsupported->Capability());
    for (const auto& capability : unsupported->Available()) {
      info.add_available_capabilities(capability);
    }
  }
  return info;
}

::grpc::Status ToStatus(const std::exception& e) {
  return {CodeFor(e), e.what(), ToErrorInfo(e).SerializeAsString()};
}

} // namespace bay::grpc
