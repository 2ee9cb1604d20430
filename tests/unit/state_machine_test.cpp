#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>
#include <optional>

namespace {

using namespace bay::v1;
using bay::model::CanTransition;
using bay::model::DeriveStatus;
using bay::model::ExtendedExpiry;
using bay::model::HasExpired;
using bay::model::IsLiveSession;
using bay::model::IsTerminal;

void TestDerivedStatusFollowsSession() {
  assert(DeriveStatus(false, false, std::nullopt) == SANDBOX_STATUS_IDLE);
  assert(DeriveStatus(false, false, SESSION_STATE_PENDING) == SANDBOX_STATUS_STARTING);
  assert(DeriveStatus(false, false, SESSION_STATE_STARTING) == SANDBOX_STATUS_STARTING);
  assert(DeriveStatus(false, false, SESSION_STATE_RUNNING) == SANDBOX_STATUS_READY);
  assert(DeriveStatus(false, false, SESSION_STATE_FAILED) == SANDBOX_STATUS_FAILED);
  assert(DeriveStatus(false, false, SESSION_STATE_STOPPING) == SANDBOX_STATUS_IDLE);
  assert(DeriveStatus(false, false, SESSION_STATE_STOPPED) == SANDBOX_STATUS_IDLE);
}

void TestDeletedAndExpiredDominate() {
  assert(DeriveStatus(true, true, SESSION_STATE_RUNNING) == SANDBOX_STATUS_DELETED);
  assert(DeriveStatus(false, true, SESSION_STATE_RUNNING) == SANDBOX_STATUS_EXPIRED);
  assert(DeriveStatus(false, true, std::nullopt) == SANDBOX_STATUS_EXPIRED);
}

void TestTerminalStatusesNeverRevive() {
  assert(IsTerminal(SANDBOX_STATUS_EXPIRED));
  assert(IsTerminal(SANDBOX_STATUS_DELETED));
  assert(!IsTerminal(SANDBOX_STATUS_READY));

  for (auto to : {SANDBOX_STATUS_IDLE, SANDBOX_STATUS_STARTING, SANDBOX_STATUS_READY, SANDBOX_STATUS_FAILED}) {
    assert(!CanTransition(SANDBOX_STATUS_EXPIRED, to));
    assert(!CanTransition(SANDBOX_STATUS_DELETED, to));
  }
  assert(CanTransition(SANDBOX_STATUS_EXPIRED, SANDBOX_STATUS_DELETED));
  assert(!CanTransition(SANDBOX_STATUS_DELETED, SANDBOX_STATUS_EXPIRED));
}

void TestLifecycleEdges() {
  assert(CanTransition(SANDBOX_STATUS_IDLE, SANDBOX_STATUS_STARTING));
  assert(CanTransition(SANDBOX_STATUS_STARTING, SANDBOX_STATUS_READY));
  assert(CanTransition(SANDBOX_STATUS_STARTING, SANDBOX_STATUS_FAILED));
  assert(CanTransition(SANDBOX_STATUS_READY, SANDBOX_STATUS_IDLE));
  assert(CanTransition(SANDBOX_STATUS_FAILED, SANDBOX_STATUS_STARTING));
  assert(CanTransition(SANDBOX_STATUS_READY, SANDBOX_STATUS_EXPIRED));
  assert(CanTransition(SANDBOX_STATUS_READY, SANDBOX_STATUS_DELETED));

  assert(!CanTransition(SANDBOX_STATUS_IDLE, SANDBOX_STATUS_READY));
  assert(!CanTransition(SANDBOX_STATUS_READY, SANDBOX_STATUS_STARTING));
}

void TestLiveSessions() {
  assert(IsLiveSession(SESSION_STATE_PENDING));
  assert(IsLiveSession(SESSION_STATE_STARTING));
  assert(IsLiveSession(SESSION_STATE_RUNNING));
  assert(!IsLiveSession(SESSION_STATE_FAILED));
  assert(!IsLiveSession(SESSION_STATE_STOPPING));
  assert(!IsLiveSession(SESSION_STATE_STOPPED));
}

void TestExpiryArithmetic() {
  assert(!HasExpired(std::nullopt, 10));
  assert(!HasExpired(10, 10));
  assert(HasExpired(10, 11));

  // Still in the future: extends from the old expiry.
  assert(ExtendedExpiry(5'000, 1'000, 2'000) == 7'000);
  // Exactly now: extends from now.
  assert(ExtendedExpiry(1'000, 1'000, 2'000) == 3'000);
}

} // namespace

int main() {
  TestDerivedStatusFollowsSession();
  TestDeletedAndExpiredDominate();
  TestTerminalStatusesNeverRevive();
  TestLifecycleEdges();
  TestLiveSessions();
  TestExpiryArithmetic();

  std::cout << "bay_unit_state_machine: pass\n";
  return 0;
}
