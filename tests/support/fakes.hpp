#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/adapter/runtime_adapter.hpp"
#include "internal/core/profile_registry.hpp"
#include "internal/core/sandbox_manager.hpp"
#include "internal/core/workspace_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/driver/compute_driver.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace bay::testing {

inline constexpr const char* kRuntimeType = "ship";
inline constexpr const char* kProfileId   = "python-default";

/*
  In-process compute driver. Records every call; failure and latency are
  switchable per test.
*/
class FakeComputeDriver final : public driver::ComputeDriver {
 public:
  driver::StartedInstance Start(const driver::InstanceRequest& request) override {
    starts_.fetch_add(1);
    if (start_delay.count() > 0) {
      std::this_thread::sleep_for(start_delay);
    }
    if (fail_start.load()) {
      throw util::DriverError("fake driver: start refused");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  id = "inst-" + std::to_string(++next_instance_);
    instances_[id]                 = request.labels;
    last_request_                  = request;
    return driver::StartedInstance{id, "fake://" + id};
  }

  void Stop(const std::string& instance_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_.push_back(instance_id);
  }

  void Destroy(const std::string& instance_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    destroyed_.push_back(instance_id);
    instances_.erase(instance_id);
  }

  std::vector<driver::InstanceInfo> ListInstances(const driver::Labels& label_filter) override {
    std::lock_guard<std::mutex>       lock(mutex_);
    std::vector<driver::InstanceInfo> out;
    for (const auto& [id, labels] : instances_) {
      bool match = true;
      for (const auto& [key, value] : label_filter) {
        auto it = labels.find(key);
        if (it == labels.end() || it->second != value) {
          match = false;
          break;
        }
      }
      if (match) {
        out.push_back(driver::InstanceInfo{id, labels});
      }
    }
    return out;
  }

  void CreateVolume(const std::string& name, const driver::Labels&, uint32_t) override {
    if (fail_create_volume.load()) {
      throw util::DriverError("fake driver: volume create refused");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    volumes_.insert(name);
  }

  void DeleteVolume(const std::string& name) override {
    if (fail_delete_volume.load()) {
      throw util::DriverError("fake driver: volume delete refused");
    }
    if (on_delete_volume) {
      on_delete_volume(name);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    volumes_.erase(name);
  }

  // Simulates an instance the control plane lost track of.
  void Inject(const std::string& instance_id, driver::Labels labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    instances_[instance_id] = std::move(labels);
  }

  int Starts() const {
    return starts_.load();
  }

  std::vector<std::string> Destroyed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return destroyed_;
  }

  bool HasInstance(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.contains(instance_id);
  }

  std::size_t InstanceCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
  }

  bool HasVolume(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return volumes_.contains(name);
  }

  std::size_t VolumeCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return volumes_.size();
  }

  driver::InstanceRequest LastRequest() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_;
  }

  std::atomic<bool>         fail_start{false};
  std::atomic<bool>         fail_create_volume{false};
  std::atomic<bool>         fail_delete_volume{false};
  // Runs on the caller's thread before the volume disappears.
  std::function<void(const std::string&)> on_delete_volume;
  std::chrono::milliseconds start_delay{0};

 private:
  std::atomic<int>                        starts_{0};
  std::mutex                              mutex_;
  uint64_t                                next_instance_ = 0;
  std::map<std::string, driver::Labels>   instances_;
  std::set<std::string>                   volumes_;
  std::vector<std::string>                stopped_;
  std::vector<std::string>                destroyed_;
  driver::InstanceRequest                 last_request_;
};

// Health switch shared by every adapter a registry hands out.
struct RuntimeControl {
  std::atomic<bool>        healthy{true};
  std::vector<std::string> capabilities{"filesystem", "shell", "python"};
};

class FakeRuntimeAdapter final : public adapter::RuntimeAdapter {
 public:
  FakeRuntimeAdapter(std::string endpoint, std::shared_ptr<RuntimeControl> control)
      : endpoint_(std::move(endpoint)), control_(std::move(control)) {
  }

  const std::string& RuntimeType() const override {
    return type_;
  }

  const std::string& Endpoint() const override {
    return endpoint_;
  }

  bool Healthy() override {
    return control_->healthy.load();
  }

 protected:
  adapter::RuntimeMeta FetchMeta() override {
    return adapter::RuntimeMeta{type_, "1.0.0-test", control_->capabilities};
  }

 private:
  std::string                     type_ = kRuntimeType;
  std::string                     endpoint_;
  std::shared_ptr<RuntimeControl> control_;
};

// Settable wall clock for TTL and idle arithmetic.
class FakeClock {
 public:
  FakeClock() : now_ms_(std::make_shared<std::atomic<uint64_t>>(1'700'000'000'000ULL)) {
  }

  util::NowFn Fn() const {
    auto now_ms = now_ms_;
    return [now_ms] { return util::FromUnixMillis(now_ms->load()); };
  }

  uint64_t NowMs() const {
    return now_ms_->load();
  }

  void Advance(std::chrono::milliseconds by) {
    now_ms_->fetch_add(static_cast<uint64_t>(by.count()));
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_ms_;
};

inline bay::runtime::config::RuntimeConfig TestConfig() {
  bay::runtime::config::RuntimeConfig config;
  auto*                               profile = config.add_profiles();
  profile->set_id(kProfileId);
  profile->set_image("ship:latest");
  profile->set_runtime_type(kRuntimeType);
  profile->set_cpus(1.0);
  profile->set_memory("1g");
  profile->add_capabilities("filesystem");
  profile->add_capabilities("shell");
  profile->add_capabilities("python");
  profile->set_idle_timeout_seconds(60);
  profile->set_runtime_port(8123);
  config.mutable_sandbox()->set_default_profile(kProfileId);
  return config;
}

/*
  Orchestrator wired over the memory store and the fakes above, with
  short readiness budgets so failing paths finish quickly.
*/
struct Harness {
  explicit Harness(std::chrono::milliseconds readiness_timeout = std::chrono::milliseconds(2000)) {
    repository = std::make_shared<db::memory::MemoryRepository>();
    driver     = std::make_shared<FakeComputeDriver>();
    runtime    = std::make_shared<RuntimeControl>();

    auto registry = std::make_shared<adapter::AdapterRegistry>();
    auto control  = runtime;
    registry->Register(kRuntimeType, [control](const std::string& endpoint) {
      return std::make_shared<FakeRuntimeAdapter>(endpoint, control);
    });
    adapters = registry;
    profiles = std::make_shared<core::ProfileRegistry>(TestConfig());

    workspaces = std::make_shared<core::WorkspaceManager>(repository, driver, core::WorkspaceOptions{}, clock.Fn());

    core::SandboxManagerOptions options;
    options.readiness = core::RetryPolicy{0, std::chrono::milliseconds(5), std::chrono::milliseconds(20), 2.0, readiness_timeout};
    options.retry_after_ms = 250;
    options.max_extend     = std::chrono::seconds(3600);
    manager = std::make_shared<core::SandboxManager>(repository, driver, adapters, profiles, workspaces, options, clock.Fn());
  }

  FakeClock                                       clock;
  std::shared_ptr<db::memory::MemoryRepository>   repository;
  std::shared_ptr<FakeComputeDriver>              driver;
  std::shared_ptr<RuntimeControl>                 runtime;
  std::shared_ptr<const adapter::AdapterRegistry> adapters;
  std::shared_ptr<const core::ProfileRegistry>    profiles;
  std::shared_ptr<core::WorkspaceManager>         workspaces;
  std::shared_ptr<core::SandboxManager>           manager;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

} // namespace bay::testing
