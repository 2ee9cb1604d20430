#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/gc/gc_task.hpp"

namespace bay::gc {

/*
  Runs each registered task on its own cadence, one thread per task.

  A task never overlaps with itself; different tasks may run concurrently.
  Stop() interrupts the waits between runs and joins every thread.
*/
class GcScheduler {
 public:
  GcScheduler() = default;
  ~GcScheduler();

  GcScheduler(const GcScheduler&)            = delete;
  GcScheduler& operator=(const GcScheduler&) = delete;

  // Register before Start().
  void AddTask(std::shared_ptr<GcTask> task, std::chrono::milliseconds interval);

  // Startup catch-up: every task once, in registration order.
  std::vector<GcResult> RunOnce();

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

 private:
  struct Entry {
    std::shared_ptr<GcTask>     task;
    std::chrono::milliseconds   interval;
    std::unique_ptr<std::mutex> run_mutex;
  };

  void     Run(Entry& entry);
  GcResult ExecuteExclusive(Entry& entry);

  std::vector<Entry>       entries_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};

  std::mutex              wait_mutex_;
  std::condition_variable wake_;
};

} // namespace bay::gc
