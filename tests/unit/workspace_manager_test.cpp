#include "internal/core/workspace_manager.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using bay::core::WorkspaceManager;
using bay::testing::Harness;
using bay::testing::Throws;

void TestCreateExternalWorkspace() {
  Harness h;
  const auto workspace = h.workspaces->CreateExternal("alice", 0);

  assert(workspace.id().rfind("ws-", 0) == 0);
  assert(!workspace.managed());
  assert(workspace.managed_by_sandbox_id().empty());
  assert(workspace.size_limit_mb() == 1024);
  assert(h.driver->HasVolume(WorkspaceManager::VolumeNameFor(workspace.id())));

  const auto sized = h.workspaces->CreateExternal("alice", 256);
  assert(sized.size_limit_mb() == 256);
}

void TestCreateExternalFailsWithoutVolume() {
  Harness h;
  h.driver->fail_create_volume = true;
  assert(Throws<bay::util::DriverError>([&] { h.workspaces->CreateExternal("alice", 0); }));
  assert(h.workspaces->ListOrphans(true).empty());
}

void TestDeleteExternalRefusesWhileReferenced() {
  Harness h;
  const auto workspace = h.workspaces->CreateExternal("alice", 0);
  const auto first     = h.manager->Create("alice", "", workspace.id(), 0);
  const auto second    = h.manager->Create("alice", "", workspace.id(), 0);

  assert(Throws<bay::util::Conflict>([&] { h.workspaces->DeleteExternal("alice", workspace.id()); }));
  h.manager->Delete("alice", first.id());
  assert(Throws<bay::util::Conflict>([&] { h.workspaces->DeleteExternal("alice", workspace.id()); }));
  h.manager->Delete("alice", second.id());

  h.workspaces->DeleteExternal("alice", workspace.id());
  assert(!h.driver->HasVolume(WorkspaceManager::VolumeNameFor(workspace.id())));
  assert(Throws<bay::util::NotFound>([&] { h.workspaces->DeleteExternal("alice", workspace.id()); }));
}

void TestCreateCannotBindWorkspaceBeingDeleted() {
  Harness h;
  const auto workspace = h.workspaces->CreateExternal("alice", 0);

  // A sandbox creation arrives while the volume is being torn down.
  std::thread creator;
  bool        create_not_found = false;
  h.driver->on_delete_volume   = [&](const std::string&) {
    creator = std::thread([&] {
      create_not_found = Throws<bay::util::NotFound>([&] { h.manager->Create("alice", "", workspace.id(), 0); });
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  };

  h.workspaces->DeleteExternal("alice", workspace.id());
  creator.join();
  h.driver->on_delete_volume = nullptr;

  assert(create_not_found);
  assert(!h.driver->HasVolume(WorkspaceManager::VolumeNameFor(workspace.id())));
  const auto listing = h.manager->List("alice", std::nullopt, 100, "");
  assert(listing.items.empty());
}

void TestOrphanReclaimWaitsOutBinding() {
  Harness h;
  const auto workspace = h.workspaces->CreateExternal("alice", 0);
  const auto orphans   = h.workspaces->ListOrphans(true);
  assert(orphans.size() == 1);

  // While a creation holds the workspace, reconciliation skips it.
  bool reclaimed = true;
  {
    auto        binding = h.workspaces->EnterWorkspace(workspace.id());
    std::thread reconciler([&] { reclaimed = h.workspaces->ReclaimIfOrphan(orphans[0], true); });
    reconciler.join();
  }
  assert(!reclaimed);
  assert(h.driver->HasVolume(WorkspaceManager::VolumeNameFor(workspace.id())));

  assert(h.workspaces->ReclaimIfOrphan(orphans[0], true));
  assert(!h.driver->HasVolume(WorkspaceManager::VolumeNameFor(workspace.id())));
}

void TestDeleteExternalScopesAndKinds() {
  Harness h;
  const auto external = h.workspaces->CreateExternal("alice", 0);
  assert(Throws<bay::util::NotFound>([&] { h.workspaces->DeleteExternal("bob", external.id()); }));

  // Managed workspaces go away with their sandbox only.
  const auto sandbox = h.manager->Create("alice", "", "", 0);
  assert(Throws<bay::util::ValidationError>([&] { h.workspaces->DeleteExternal("alice", sandbox.workspace_id()); }));
}

void TestReclaimRefusesLiveManagedWorkspace() {
  Harness h;
  const auto sandbox = h.manager->Create("alice", "", "", 0);

  bay::db::model::WorkspaceRecord record;
  {
    auto tx = h.repository->Begin();
    record  = *h.repository->GetWorkspace(*tx, sandbox.workspace_id());
    tx->Commit();
  }

  assert(Throws<bay::util::Conflict>([&] { h.workspaces->Reclaim(record); }));
  assert(h.driver->HasVolume(record.volume_name));
  assert(h.workspaces->ListOrphans(true).empty());
}

void TestOrphansAndReclaimIfOrphan() {
  Harness h;
  const auto unused  = h.workspaces->CreateExternal("alice", 0);
  const auto used    = h.workspaces->CreateExternal("alice", 0);
  const auto sandbox = h.manager->Create("alice", "", used.id(), 0);
  (void)sandbox;

  // External workspaces are only candidates when asked for.
  assert(h.workspaces->ListOrphans(false).empty());
  const auto orphans = h.workspaces->ListOrphans(true);
  assert(orphans.size() == 1);
  assert(orphans[0].id == unused.id());

  // Referenced by the time of the re-check: skipped.
  h.manager->Create("alice", "", unused.id(), 0);
  assert(!h.workspaces->ReclaimIfOrphan(orphans[0], true));
  assert(h.driver->HasVolume(WorkspaceManager::VolumeNameFor(unused.id())));
}

void TestManagedOrphanDetachesDeletedSandbox() {
  Harness h;
  const auto sandbox = h.manager->Create("alice", "", "", 0);

  h.driver->fail_delete_volume = true;
  h.manager->Delete("alice", sandbox.id());
  h.driver->fail_delete_volume = false;

  const auto orphans = h.workspaces->ListOrphans(false);
  assert(orphans.size() == 1);
  assert(h.workspaces->ReclaimIfOrphan(orphans[0], false));
  assert(!h.driver->HasVolume(orphans[0].volume_name));

  auto tx     = h.repository->Begin();
  auto record = h.repository->GetSandbox(*tx, sandbox.id());
  assert(record.has_value());
  assert(record->deleted_at_ms.has_value());
  assert(record->workspace_id.empty());
  assert(!h.repository->GetWorkspace(*tx, orphans[0].id).has_value());
  tx->Commit();
}

} // namespace

int main() {
  TestCreateExternalWorkspace();
  TestCreateExternalFailsWithoutVolume();
  TestDeleteExternalRefusesWhileReferenced();
  TestCreateCannotBindWorkspaceBeingDeleted();
  TestOrphanReclaimWaitsOutBinding();
  TestDeleteExternalScopesAndKinds();
  TestReclaimRefusesLiveManagedWorkspace();
  TestOrphansAndReclaimIfOrphan();
  TestManagedOrphanDetachesDeletedSandbox();

  std::cout << "bay_unit_workspace_manager: pass\n";
  return 0;
}
