#pragma once

#include <cstdint>
#include <string>

namespace bay::db::model {

/*
  Persistent storage unit backed by a driver volume.

  managed: owned 1:1 by managed_by_sandbox_id, cascade-deleted with it.
  external: independent, may be referenced by several sandboxes.
*/

struct WorkspaceRecord {
  std::string id;
  std::string owner;
  std::string volume_name;

  bool        managed = false;
  std::string managed_by_sandbox_id;

  uint32_t size_limit_mb       = 0;
  uint64_t created_at_ms       = 0;
  uint64_t last_accessed_at_ms = 0;
};

} // namespace bay::db::model
