#include "internal/core/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace {

using bay::core::PollUntil;
using bay::core::RetryOnError;
using bay::core::RetryPolicy;
using std::chrono::milliseconds;

void TestBackoffGrowsAndCaps() {
  RetryPolicy policy{5, milliseconds(100), milliseconds(350), 2.0, milliseconds(0)};
  assert(policy.BackoffAfter(1) == milliseconds(100));
  assert(policy.BackoffAfter(2) == milliseconds(200));
  assert(policy.BackoffAfter(3) == milliseconds(350));
  assert(policy.BackoffAfter(10) == milliseconds(350));
}

void TestFromConfigOverridesOnlySetFields() {
  RetryPolicy defaults{3, milliseconds(500), milliseconds(1000), 2.0, milliseconds(0)};

  bay::runtime::config::RetryPolicyConfig config;
  config.set_max_attempts(7);
  config.set_timeout_ms(250);

  const auto policy = RetryPolicy::FromConfig(config, defaults);
  assert(policy.max_attempts == 7);
  assert(policy.timeout == milliseconds(250));
  assert(policy.initial_backoff == milliseconds(500));
  assert(policy.max_backoff == milliseconds(1000));
  assert(policy.backoff_factor == 2.0);
}

void TestPollUntilStopsOnSuccess() {
  RetryPolicy policy{10, milliseconds(1), milliseconds(2), 2.0, milliseconds(0)};
  int         calls = 0;
  assert(PollUntil(policy, [&] { return ++calls == 3; }));
  assert(calls == 3);
}

void TestPollUntilHonoursAttemptLimit() {
  RetryPolicy policy{4, milliseconds(1), milliseconds(1), 1.0, milliseconds(0)};
  int         calls = 0;
  assert(!PollUntil(policy, [&] {
    ++calls;
    return false;
  }));
  assert(calls == 4);
}

void TestPollUntilHonoursTimeBudget() {
  RetryPolicy policy{0, milliseconds(10), milliseconds(10), 1.0, milliseconds(80)};
  const auto  started = std::chrono::steady_clock::now();
  assert(!PollUntil(policy, [] { return false; }));
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed >= milliseconds(70));
  assert(elapsed < milliseconds(2000));
}

void TestRetryOnErrorRetriesThenSucceeds() {
  RetryPolicy policy{3, milliseconds(1), milliseconds(1), 1.0, milliseconds(0)};
  int         calls = 0;
  RetryOnError(policy, [&] {
    if (++calls < 3) {
      throw std::runtime_error("transient");
    }
  });
  assert(calls == 3);
}

void TestRetryOnErrorRethrowsLastError() {
  RetryPolicy policy{2, milliseconds(1), milliseconds(1), 1.0, milliseconds(0)};
  int         calls = 0;
  bool        threw = false;
  try {
    RetryOnError(policy, [&] { throw std::runtime_error("attempt " + std::to_string(++calls)); });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "attempt 2";
  }
  assert(threw);
  assert(calls == 2);
}

} // namespace

int main() {
  TestBackoffGrowsAndCaps();
  TestFromConfigOverridesOnlySetFields();
  TestPollUntilStopsOnSuccess();
  TestPollUntilHonoursAttemptLimit();
  TestPollUntilHonoursTimeBudget();
  TestRetryOnErrorRetriesThenSucceeds();
  TestRetryOnErrorRethrowsLastError();

  std::cout << "bay_unit_retry_policy: pass\n";
  return 0;
}
