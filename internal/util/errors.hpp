#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bay::util {

/*
  Central error types.

  Every error surfaced to callers carries a stable machine readable code.
  These get translated later to gRPC status codes (see grpc_error.cpp).
*/

class Error : public std::runtime_error {
 public:
  Error(std::string code, const std::string& msg, std::string sandbox_id = {})
      : std::runtime_error(msg), code_(std::move(code)), sandbox_id_(std::move(sandbox_id)) {
  }

  const std::string& Code() const noexcept {
    return code_;
  }
  const std::string& SandboxId() const noexcept {
    return sandbox_id_;
  }

 private:
  std::string code_;
  std::string sandbox_id_;
};

class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg, std::string sandbox_id = {}) : Error("not_found", msg, std::move(sandbox_id)) {
  }
};

// Idempotency key reuse with a different request, or a still referenced workspace.
class Conflict : public Error {
 public:
  explicit Conflict(const std::string& msg, std::string sandbox_id = {}) : Error("conflict", msg, std::move(sandbox_id)) {
  }
};

class SandboxExpired : public Error {
 public:
  SandboxExpired(const std::string& msg, std::string sandbox_id, uint64_t expires_at_ms)
      : Error("sandbox_expired", msg, std::move(sandbox_id)), expires_at_ms_(expires_at_ms) {
  }

  uint64_t ExpiresAtMs() const noexcept {
    return expires_at_ms_;
  }

 private:
  uint64_t expires_at_ms_;
};

class SandboxTtlInfinite : public Error {
 public:
  SandboxTtlInfinite(const std::string& msg, std::string sandbox_id) : Error("sandbox_ttl_infinite", msg, std::move(sandbox_id)) {
  }
};

/*
  Compute is still starting. Retriable by the caller after RetryAfterMs().
*/
class SessionNotReady : public Error {
 public:
  SessionNotReady(const std::string& msg, std::string sandbox_id, uint32_t retry_after_ms)
      : Error("session_not_ready", msg, std::move(sandbox_id)), retry_after_ms_(retry_after_ms) {
  }

  uint32_t RetryAfterMs() const noexcept {
    return retry_after_ms_;
  }

 private:
  uint32_t retry_after_ms_;
};

class Timeout : public Error {
 public:
  explicit Timeout(const std::string& msg, std::string sandbox_id = {}) : Error("timeout", msg, std::move(sandbox_id)) {
  }
};

class DriverError : public Error {
 public:
  explicit DriverError(const std::string& msg, std::string sandbox_id = {}) : Error("driver_error", msg, std::move(sandbox_id)) {
  }
};

class ValidationError : public Error {
 public:
  explicit ValidationError(const std::string& msg) : Error("validation_error", msg) {
  }
};

class CapabilityNotSupported : public Error {
 public:
  CapabilityNotSupported(const std::string& msg, std::string sandbox_id, std::string capability, std::vector<std::string> available)
      : Error("capability_not_supported", msg, std::move(sandbox_id)), capability_(std::move(capability)), available_(std::move(available)) {
  }

  const std::string& Capability() const noexcept {
    return capability_;
  }
  const std::vector<std::string>& Available() const noexcept {
    return available_;
  }

 private:
  std::string              capability_;
  std::vector<std::string> available_;
};

} // namespace bay::util
