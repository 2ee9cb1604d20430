#include "internal/gc/gc_scheduler.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace bay::gc {

using bay::observability::IntField;

GcScheduler::~GcScheduler() {
  Stop();
}

void GcScheduler::AddTask(std::shared_ptr<GcTask> task, std::chrono::milliseconds interval) {
  if (!task) {
    throw std::invalid_argument("GcScheduler: task is required");
  }
  if (interval.count() <= 0) {
    throw std::invalid_argument(std::string("GcScheduler: interval of ") + task->Name() + " must be positive");
  }
  if (running_) {
    throw std::logic_error("GcScheduler: tasks must be added before Start()");
  }
  entries_.push_back(Entry{std::move(task), interval, std::make_unique<std::mutex>()});
}

GcResult GcScheduler::ExecuteExclusive(Entry& entry) {
  std::lock_guard<std::mutex> lock(*entry.run_mutex);
  return entry.task->Execute();
}

std::vector<GcResult> GcScheduler::RunOnce() {
  std::vector<GcResult> results;
  results.reserve(entries_.size());
  for (auto& entry : entries_) {
    results.push_back(ExecuteExclusive(entry));
  }
  return results;
}

void GcScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  for (auto& entry : entries_) {
    threads_.emplace_back(&GcScheduler::Run, this, std::ref(entry));
  }
  BAY_LOG_INFO("gc scheduler started", {IntField("tasks", static_cast<int64_t>(entries_.size()))});
}

void GcScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wake_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
  BAY_LOG_INFO("gc scheduler stopped");
}

void GcScheduler::Run(Entry& entry) {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      if (wake_.wait_for(lock, entry.interval, [this] { return !running_.load(); })) {
        return;
      }
    }
    ExecuteExclusive(entry);
  }
}

} // namespace bay::gc
