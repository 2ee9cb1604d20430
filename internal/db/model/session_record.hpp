#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "bay/v1/types.pb.h"

namespace bay::db::model {

/*
  One compute instance bound to a sandbox. Hard-deleted on stop/destroy.

  The store keeps at most one session row per sandbox (unique sandbox_id).
*/

struct SessionRecord {
  std::string id;
  std::string sandbox_id;
  std::string profile_id;
  std::string runtime_type;

  bay::v1::SessionState desired_state  = bay::v1::SESSION_STATE_UNSPECIFIED;
  bay::v1::SessionState observed_state = bay::v1::SESSION_STATE_UNSPECIFIED;

  // Driver assigned reference, empty until the driver started an instance.
  std::string instance_id;
  std::string endpoint;

  // Meaningful only while observed_state is RUNNING.
  std::optional<uint64_t> idle_expires_at_ms;

  uint64_t    created_at_ms     = 0;
  uint64_t    last_active_at_ms = 0;
  std::string last_error;
};

} // namespace bay::db::model
