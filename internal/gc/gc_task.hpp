#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "internal/core/retry_policy.hpp"

namespace bay::gc {

struct GcResult {
  std::string               task;
  uint64_t                  cleaned = 0;
  uint64_t                  skipped = 0;
  uint64_t                  errors  = 0;
  std::chrono::milliseconds duration{0};
};

/*
  One reconciliation task.

  Execute() never throws: a failed item is logged and counted and the
  batch carries on. Items are reclaimed one at a time, each retried per
  the item policy.
*/
class GcTask {
 public:
  explicit GcTask(core::RetryPolicy item_retry) : item_retry_(item_retry) {
  }
  virtual ~GcTask() = default;

  virtual const char* Name() const = 0;

  GcResult Execute();

 protected:
  virtual void Collect(GcResult& result) = 0;

  // `reclaim` returns false when the item no longer qualified and was skipped.
  void Item(GcResult& result, const std::string& item, const std::function<bool()>& reclaim);

 private:
  core::RetryPolicy item_retry_;
};

} // namespace bay::gc
