#pragma once

#include <cstdint>
#include <string>

namespace bay::db::model {

// Keyed by (owner, key). The fingerprint never changes for the lifetime of a row.
struct IdempotencyRecord {
  std::string owner;
  std::string key;
  std::string fingerprint;

  std::string response_snapshot;
  int32_t     status_code = 0;

  uint64_t created_at_ms = 0;
  uint64_t expires_at_ms = 0;
};

} // namespace bay::db::model
