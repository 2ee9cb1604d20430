#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "config/config.pb.h"

namespace bay::core {

/*
  Bounded retry: attempt count, exponential backoff and a wall-clock budget.

  max_attempts == 0 means "until the budget runs out"; timeout == 0 means
  "until the attempts run out". At least one of them must be non-zero.
*/
struct RetryPolicy {
  uint32_t                  max_attempts = 3;
  std::chrono::milliseconds initial_backoff{500};
  std::chrono::milliseconds max_backoff{1000};
  double                    backoff_factor = 2.0;
  std::chrono::milliseconds timeout{0};

  // Delay after the given (1-based) failed attempt.
  std::chrono::milliseconds BackoffAfter(uint32_t attempt) const;

  // Fields set in `config` override `defaults`.
  static RetryPolicy FromConfig(const bay::runtime::config::RetryPolicyConfig& config, const RetryPolicy& defaults);
};

// Calls `probe` until it returns true. False once the policy is exhausted.
bool PollUntil(const RetryPolicy& policy, const std::function<bool()>& probe);

// Calls `action` until it returns normally; rethrows the last error once the policy is exhausted.
void RetryOnError(const RetryPolicy& policy, const std::function<void()>& action);

} // namespace bay::core
