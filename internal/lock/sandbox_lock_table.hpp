#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace bay::lock {

/*
  Per-sandbox exclusive sections, scoped to the orchestrator's lifetime.

  Each section also records the outcome of the last start attempt made
  under it, so callers that queued behind a winner can adopt the winner's
  failure instead of starting again.
*/
class SandboxLockTable {
 private:
  struct Section {
    std::timed_mutex      mutex;
    std::atomic<uint64_t> generation{0};
    std::exception_ptr    last_error; // guarded by mutex
  };

 public:
  /*
    RAII holder of one section. Releases on destruction, on every exit path.
  */
  class Guard {
   public:
    Guard(Guard&&) noexcept = default;
    // a guard owns exactly one section for its whole life
    Guard& operator=(Guard&&) = delete;
    ~Guard()                  = default;

    // Outcome bookkeeping for the attempt run under this guard.
    void PublishSuccess();
    void PublishFailure(std::exception_ptr error);

    // Failure published by an attempt completed after `seen_generation`, if any.
    std::exception_ptr FailureSince(uint64_t seen_generation) const;

   private:
    friend class SandboxLockTable;
    explicit Guard(std::shared_ptr<Section> section);

    std::shared_ptr<Section>               section_;
    std::unique_lock<std::timed_mutex>     lock_;
  };

  // Blocks up to `timeout`; nullopt when the section stayed busy.
  std::optional<Guard> Acquire(const std::string& sandbox_id, std::chrono::milliseconds timeout);

  // Non-blocking; nullopt when busy. Used by background reconciliation.
  std::optional<Guard> TryAcquire(const std::string& sandbox_id);

  // Generation observed before waiting, compared after acquisition.
  uint64_t Generation(const std::string& sandbox_id);

  // Drops the section of a deleted sandbox when nobody holds or waits on it.
  void Prune(const std::string& sandbox_id);

  std::size_t Size();

 private:
  std::shared_ptr<Section> SectionFor(const std::string& sandbox_id);

  std::mutex                                                guard_;
  std::unordered_map<std::string, std::shared_ptr<Section>> sections_;
};

} // namespace bay::lock
