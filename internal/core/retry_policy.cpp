#include "internal/core/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace bay::core {

namespace {

using SteadyClock = std::chrono::steady_clock;

class Budget {
 public:
  explicit Budget(const RetryPolicy& policy) : policy_(policy), deadline_(SteadyClock::now() + policy.timeout) {
  }

  // True when another attempt may run after `attempts` failures; sleeps the backoff first.
  bool WaitForNext(uint32_t attempts) const {
    if (policy_.max_attempts > 0 && attempts >= policy_.max_attempts) {
      return false;
    }

    auto delay = policy_.BackoffAfter(attempts);
    if (policy_.timeout.count() > 0) {
      const auto now = SteadyClock::now();
      if (now >= deadline_) {
        return false;
      }
      delay = std::min(delay, std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now));
    }

    std::this_thread::sleep_for(delay);
    return policy_.timeout.count() == 0 || SteadyClock::now() < deadline_;
  }

 private:
  const RetryPolicy&      policy_;
  SteadyClock::time_point deadline_;
};

} // namespace

std::chrono::milliseconds RetryPolicy::BackoffAfter(uint32_t attempt) const {
  const double exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
  const double scaled   = static_cast<double>(initial_backoff.count()) * std::pow(std::max(backoff_factor, 1.0), exponent);
  const auto   capped   = std::min(scaled, static_cast<double>(std::max(max_backoff, initial_backoff).count()));
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

RetryPolicy RetryPolicy::FromConfig(const bay::runtime::config::RetryPolicyConfig& config, const RetryPolicy& defaults) {
  RetryPolicy policy = defaults;
  if (config.max_attempts() > 0) policy.max_attempts = config.max_attempts();
  if (config.initial_backoff_ms() > 0) policy.initial_backoff = std::chrono::milliseconds(config.initial_backoff_ms());
  if (config.max_backoff_ms() > 0) policy.max_backoff = std::chrono::milliseconds(config.max_backoff_ms());
  if (config.backoff_factor() > 0) policy.backoff_factor = config.backoff_factor();
  if (config.timeout_ms() > 0) policy.timeout = std::chrono::milliseconds(config.timeout_ms());
  return policy;
}

bool PollUntil(const RetryPolicy& policy, const std::function<bool()>& probe) {
  Budget   budget(policy);
  uint32_t attempts = 0;
  for (;;) {
    if (probe()) {
      return true;
    }
    ++attempts;
    if (!budget.WaitForNext(attempts)) {
      return false;
    }
  }
}

void RetryOnError(const RetryPolicy& policy, const std::function<void()>& action) {
  Budget   budget(policy);
  uint32_t attempts = 0;
  for (;;) {
    try {
      action();
      return;
    } catch (const std::exception&) {
      ++attempts;
      if (!budget.WaitForNext(attempts)) {
        throw;
      }
    }
  }
}

} // namespace bay::core
