#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/gc/gc_scheduler.hpp"
#include "internal/gc/gc_tasks.hpp"
#include "internal/idempotency/idempotency_ledger.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using bay::core::RetryPolicy;
using bay::core::WorkspaceManager;
using bay::gc::GcResult;
using bay::gc::GcScheduler;
using bay::gc::GcTask;
using bay::testing::Harness;
using bay::testing::Throws;
using std::chrono::milliseconds;
using std::chrono::seconds;

RetryPolicy FastRetry(uint32_t attempts = 2) {
  return RetryPolicy{attempts, milliseconds(1), milliseconds(2), 2.0, milliseconds(0)};
}

void TestExpiredSandboxGcReclaimsEverything() {
  Harness h;
  const auto expiring = h.manager->Create("alice", "", "", 10);
  const auto keeper   = h.manager->Create("alice", "", "", 0);
  h.manager->EnsureRunning("alice", expiring.id());

  bay::gc::ExpiredSandboxGc task(h.repository, h.manager, FastRetry(), h.clock.Fn());
  auto                      result = task.Execute();
  assert(result.task == "expired_sandbox");
  assert(result.cleaned == 0);

  h.clock.Advance(seconds(11));
  result = task.Execute();
  assert(result.cleaned == 1);
  assert(result.errors == 0);

  assert(h.driver->InstanceCount() == 0);
  assert(!h.driver->HasVolume(WorkspaceManager::VolumeNameFor(expiring.workspace_id())));
  assert(Throws<bay::util::NotFound>([&] { h.manager->Get("alice", expiring.id()); }));
  assert(h.manager->Get("alice", keeper.id()).status() == bay::v1::SANDBOX_STATUS_IDLE);
}

void TestIdleSessionGcStopsComputeOnly() {
  Harness h;
  const auto sandbox = h.manager->Create("alice", "", "", 0);
  h.manager->EnsureRunning("alice", sandbox.id());

  bay::gc::IdleSessionGc task(h.repository, h.manager, FastRetry(), h.clock.Fn());
  assert(task.Execute().cleaned == 0);

  h.clock.Advance(seconds(61));
  const auto result = task.Execute();
  assert(result.task == "idle_session");
  assert(result.cleaned == 1);
  assert(h.driver->InstanceCount() == 0);
  assert(h.manager->Get("alice", sandbox.id()).status() == bay::v1::SANDBOX_STATUS_IDLE);

  // The next request transparently starts new compute.
  h.manager->EnsureRunning("alice", sandbox.id());
  assert(h.driver->Starts() == 2);
}

void TestOrphanWorkspaceGc() {
  Harness h;
  const auto sandbox  = h.manager->Create("alice", "", "", 0);
  const auto external = h.workspaces->CreateExternal("alice", 0);

  h.driver->fail_delete_volume = true;
  h.manager->Delete("alice", sandbox.id());

  // Volume deletion keeps failing: counted as an error, record kept.
  bay::gc::OrphanWorkspaceGc strict(h.workspaces, false, FastRetry());
  auto                       result = strict.Execute();
  assert(result.errors == 1);
  assert(result.cleaned == 0);

  h.driver->fail_delete_volume = false;
  result                       = strict.Execute();
  assert(result.task == "orphan_workspace");
  assert(result.cleaned == 1);
  assert(!h.driver->HasVolume(WorkspaceManager::VolumeNameFor(sandbox.workspace_id())));
  assert(h.driver->HasVolume(WorkspaceManager::VolumeNameFor(external.id())));

  bay::gc::OrphanWorkspaceGc inclusive(h.workspaces, true, FastRetry());
  assert(inclusive.Execute().cleaned == 1);
  assert(!h.driver->HasVolume(WorkspaceManager::VolumeNameFor(external.id())));
}

void TestOrphanInstanceGc() {
  Harness h;
  const auto sandbox = h.manager->Create("alice", "", "", 0);
  const auto handle  = h.manager->EnsureRunning("alice", sandbox.id());

  // Lost instance of ours, instance of a dead session, and someone else's instance.
  h.driver->Inject("inst-lost", {{bay::driver::kManagedByLabel, "bay"}});
  h.driver->Inject("inst-stale", {{bay::driver::kManagedByLabel, "bay"}, {bay::driver::kSessionLabel, "sess-gone"}});
  h.driver->Inject("inst-foreign", {{bay::driver::kManagedByLabel, "other"}});

  bay::gc::OrphanInstanceGc task(h.repository, h.driver, "bay", FastRetry());
  const auto                result = task.Execute();
  assert(result.task == "orphan_instance");
  assert(result.cleaned == 2);

  assert(!h.driver->HasInstance("inst-lost"));
  assert(!h.driver->HasInstance("inst-stale"));
  assert(h.driver->HasInstance("inst-foreign"));
  assert(h.driver->HasInstance("inst-1"));
  assert(h.manager->EnsureRunning("alice", sandbox.id()).session_id == handle.session_id);
}

bay::db::model::SessionRecord InsertStartingSession(Harness& h, const std::string& sandbox_id, const std::string& session_id,
                                                   bay::v1::SessionState state, const std::string& instance_id) {
  bay::db::model::SessionRecord session;
  session.id                = session_id;
  session.sandbox_id        = sandbox_id;
  session.profile_id        = bay::testing::kProfileId;
  session.runtime_type      = bay::testing::kRuntimeType;
  session.desired_state     = bay::v1::SESSION_STATE_RUNNING;
  session.observed_state    = state;
  session.instance_id       = instance_id;
  session.created_at_ms     = h.clock.NowMs();
  session.last_active_at_ms = session.created_at_ms;

  auto       tx       = h.repository->Begin();
  const auto inserted = h.repository->InsertSession(*tx, session);
  assert(inserted);
  tx->Commit();
  return session;
}

void TestStaleSessionGcClearsAbandonedStarts() {
  Harness h;
  const auto crashed = h.manager->Create("alice", "", "", 0);
  const auto fresh   = h.manager->Create("alice", "", "", 0);

  // A start that died after the driver handed out an instance.
  InsertStartingSession(h, crashed.id(), "sess-crashed", bay::v1::SESSION_STATE_STARTING, "inst-crashed");
  h.driver->Inject("inst-crashed", {{bay::driver::kManagedByLabel, "bay"}, {bay::driver::kSessionLabel, "sess-crashed"}});

  // Orphan-instance reconciliation leaves it alone: the session looks live.
  bay::gc::OrphanInstanceGc orphans(h.repository, h.driver, "bay", FastRetry());
  assert(orphans.Execute().cleaned == 0);
  assert(h.driver->HasInstance("inst-crashed"));

  bay::gc::StaleSessionGc task(h.repository, h.manager, FastRetry());
  assert(task.Execute().cleaned == 0);

  h.clock.Advance(std::chrono::hours(48));
  InsertStartingSession(h, fresh.id(), "sess-fresh", bay::v1::SESSION_STATE_PENDING, "");

  const auto result = task.Execute();
  assert(result.task == "stale_session");
  assert(result.cleaned == 1);
  assert(result.errors == 0);
  assert(!h.driver->HasInstance("inst-crashed"));
  assert(h.manager->Get("alice", crashed.id()).status() == bay::v1::SANDBOX_STATUS_IDLE);
  assert(h.manager->Get("alice", fresh.id()).status() == bay::v1::SANDBOX_STATUS_STARTING);

  // The sandbox starts cleanly afterwards.
  h.manager->EnsureRunning("alice", crashed.id());
  assert(h.manager->Get("alice", crashed.id()).status() == bay::v1::SANDBOX_STATUS_READY);
}

void TestExpiredIdempotencyGc() {
  Harness h;
  auto ledger = std::make_shared<bay::idempotency::IdempotencyLedger>(
      h.repository, bay::idempotency::IdempotencyOptions{true, seconds(60)}, h.clock.Fn());
  ledger->Save({"alice", "k1", "POST", "/v1/sandboxes", "a"}, {"r", 201});
  ledger->Save({"alice", "k2", "POST", "/v1/sandboxes", "b"}, {"r", 201});

  bay::gc::ExpiredIdempotencyGc task(ledger);
  assert(task.Execute().cleaned == 0);

  h.clock.Advance(seconds(61));
  const auto result = task.Execute();
  assert(result.task == "expired_idempotency");
  assert(result.cleaned == 2);
}

class ScriptedTask final : public GcTask {
 public:
  explicit ScriptedTask(int failures_before_success) : GcTask(FastRetry(3)), failures_(failures_before_success) {
  }

  const char* Name() const override {
    return "scripted";
  }

  std::atomic<int> runs{0};
  std::atomic<int> attempts{0};

 protected:
  void Collect(GcResult& result) override {
    ++runs;
    Item(result, "item-ok", [this] {
      if (++attempts <= failures_) {
        throw std::runtime_error("transient");
      }
      return true;
    });
    Item(result, "item-skip", [] { return false; });
    Item(result, "item-broken", []() -> bool { throw std::runtime_error("permanent"); });
  }

 private:
  int failures_;
};

class ThrowingTask final : public GcTask {
 public:
  ThrowingTask() : GcTask(FastRetry()) {
  }

  const char* Name() const override {
    return "throwing";
  }

 protected:
  void Collect(GcResult&) override {
    throw std::runtime_error("listing failed");
  }
};

void TestItemsAreRetriedAndCounted() {
  ScriptedTask task(2);
  const auto   result = task.Execute();
  assert(result.cleaned == 1);
  assert(result.skipped == 1);
  assert(result.errors == 1);
  assert(task.attempts.load() == 3);
}

void TestTaskFailureNeverEscapes() {
  ThrowingTask task;
  const auto   result = task.Execute();
  assert(result.errors == 1);
  assert(result.cleaned == 0);
}

void TestSchedulerStartupPassAndCadence() {
  auto scripted = std::make_shared<ScriptedTask>(0);
  auto throwing = std::make_shared<ThrowingTask>();

  GcScheduler scheduler;
  scheduler.AddTask(scripted, milliseconds(20));
  scheduler.AddTask(throwing, milliseconds(20));
  assert(Throws<std::invalid_argument>([&] { scheduler.AddTask(scripted, milliseconds(0)); }));
  assert(Throws<std::invalid_argument>([&] { scheduler.AddTask(nullptr, milliseconds(10)); }));

  const auto results = scheduler.RunOnce();
  assert(results.size() == 2);
  assert(results[0].task == "scripted");
  assert(results[1].task == "throwing");
  assert(results[1].errors == 1);
  assert(scripted->runs.load() == 1);

  scheduler.Start();
  assert(scheduler.Running());
  assert(Throws<std::logic_error>([&] { scheduler.AddTask(std::make_shared<ThrowingTask>(), milliseconds(10)); }));

  const auto deadline = std::chrono::steady_clock::now() + seconds(5);
  while (scripted->runs.load() < 4 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  assert(scripted->runs.load() >= 4);

  scheduler.Stop();
  assert(!scheduler.Running());
  const int after_stop = scripted->runs.load();
  std::this_thread::sleep_for(milliseconds(60));
  assert(scripted->runs.load() == after_stop);

  // Idempotent.
  scheduler.Stop();
}

} // namespace

int main() {
  TestExpiredSandboxGcReclaimsEverything();
  TestIdleSessionGcStopsComputeOnly();
  TestOrphanWorkspaceGc();
  TestOrphanInstanceGc();
  TestStaleSessionGcClearsAbandonedStarts();
  TestExpiredIdempotencyGc();
  TestItemsAreRetriedAndCounted();
  TestTaskFailureNeverEscapes();
  TestSchedulerStartupPassAndCadence();

  std::cout << "bay_unit_gc: pass\n";
  return 0;
}
