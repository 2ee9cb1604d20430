#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>

#include "bay/v1/types.pb.h"

namespace bay::model {

/*
  Sandbox lifecycle.

  The composite status is derived from the sandbox record and its session,
  never stored. expired and deleted are terminal: nothing leads back from
  them to a live status.
*/

using bay::v1::SandboxStatus;
using bay::v1::SessionState;

constexpr bool IsTerminal(SandboxStatus status) {
  return status == bay::v1::SANDBOX_STATUS_EXPIRED || status == bay::v1::SANDBOX_STATUS_DELETED;
}

// Session states that still own (or are about to own) a compute instance.
constexpr bool IsLiveSession(SessionState state) {
  return state == bay::v1::SESSION_STATE_PENDING || state == bay::v1::SESSION_STATE_STARTING || state == bay::v1::SESSION_STATE_RUNNING;
}

constexpr bool CanTransition(SandboxStatus from, SandboxStatus to) {
  if (from == to) {
    return true;
  }
  if (from == bay::v1::SANDBOX_STATUS_DELETED || to == bay::v1::SANDBOX_STATUS_UNSPECIFIED) {
    return false;
  }
  if (to == bay::v1::SANDBOX_STATUS_DELETED) {
    return from != bay::v1::SANDBOX_STATUS_UNSPECIFIED;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case bay::v1::SANDBOX_STATUS_STARTING:
      return from == bay::v1::SANDBOX_STATUS_IDLE || from == bay::v1::SANDBOX_STATUS_FAILED;
    case bay::v1::SANDBOX_STATUS_READY:
    case bay::v1::SANDBOX_STATUS_FAILED:
      return from == bay::v1::SANDBOX_STATUS_STARTING;
    case bay::v1::SANDBOX_STATUS_IDLE:
      // idle reclamation / stop of a running or failed session
      return from == bay::v1::SANDBOX_STATUS_READY || from == bay::v1::SANDBOX_STATUS_FAILED;
    case bay::v1::SANDBOX_STATUS_EXPIRED:
      return from == bay::v1::SANDBOX_STATUS_IDLE || from == bay::v1::SANDBOX_STATUS_READY;
    default:
      return false;
  }
}

// A hard TTL has passed once expires_at is strictly before now.
constexpr bool HasExpired(std::optional<uint64_t> expires_at_ms, uint64_t now_ms) {
  return expires_at_ms.has_value() && *expires_at_ms < now_ms;
}

constexpr SandboxStatus DeriveStatus(bool deleted, bool expired, std::optional<SessionState> session) {
  if (deleted) {
    return bay::v1::SANDBOX_STATUS_DELETED;
  }
  if (expired) {
    return bay::v1::SANDBOX_STATUS_EXPIRED;
  }
  if (!session.has_value()) {
    return bay::v1::SANDBOX_STATUS_IDLE;
  }

  switch (*session) {
    case bay::v1::SESSION_STATE_PENDING:
    case bay::v1::SESSION_STATE_STARTING:
      return bay::v1::SANDBOX_STATUS_STARTING;
    case bay::v1::SESSION_STATE_RUNNING:
      return bay::v1::SANDBOX_STATUS_READY;
    case bay::v1::SESSION_STATE_FAILED:
      return bay::v1::SANDBOX_STATUS_FAILED;
    default:
      return bay::v1::SANDBOX_STATUS_IDLE;
  }
}

/*
  TTL extension arithmetic: new = max(old, now) + extend_by.

  Callers must have rejected an infinite (null) or already expired TTL.
*/
constexpr uint64_t ExtendedExpiry(uint64_t old_expires_at_ms, uint64_t now_ms, uint64_t extend_by_ms) {
  return std::max(old_expires_at_ms, now_ms) + extend_by_ms;
}

} // namespace bay::model
