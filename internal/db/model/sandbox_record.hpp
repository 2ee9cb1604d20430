#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bay::db::model {

/*
  Persistent sandbox row. The only externally stable handle.

  expires_at_ms is never cleared once set and never decreases.
  workspace_id may become empty only after deleted_at_ms is set.
*/

struct SandboxRecord {
  std::string id;
  std::string owner;
  std::string profile_id;
  std::string workspace_id;

  std::optional<uint64_t> expires_at_ms;
  std::optional<uint64_t> deleted_at_ms;

  uint64_t created_at_ms     = 0;
  uint64_t last_active_at_ms = 0;
};

} // namespace bay::db::model
