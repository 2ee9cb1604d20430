#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace bay::idempotency {

struct IdempotencyOptions {
  bool                 enabled = true;
  std::chrono::seconds ttl{3600};
};

// One mutating request as seen by the ledger.
struct LedgerRequest {
  std::string owner;
  std::string key;
  std::string method;
  std::string path;
  std::string body; // deterministic serialization, key excluded
};

struct CachedResponse {
  std::string snapshot;
  int32_t     status_code = 0;
};

/*
  Idempotency ledger for mutating operations.

  (owner, key) maps to the fingerprint of the first request and its
  response snapshot. A replay with the same fingerprint returns the stored
  response unchanged; a different fingerprint is a util::Conflict.
  Expired records are treated as absent and removed on sight.
*/
class IdempotencyLedger {
 public:
  IdempotencyLedger(std::shared_ptr<db::Repository> repository, IdempotencyOptions options, util::NowFn now = util::Now);

  // Throws util::ValidationError unless the key matches [A-Za-z0-9_-]{1,128}.
  static void ValidateKey(const std::string& key);

  bool Enabled() const {
    return options_.enabled;
  }

  std::optional<CachedResponse> Check(const LedgerRequest& request);

  // Stores `response`; when a concurrent writer stored first, returns the winner's record instead.
  CachedResponse Save(const LedgerRequest& request, const CachedResponse& response);

  /*
    Check, run, save. Without a key (or with the ledger disabled) this is
    just operation(). Errors thrown by operation() are never recorded.
  */
  CachedResponse Execute(const LedgerRequest& request, const std::function<CachedResponse()>& operation);

  // Deletes records past their expiry; returns how many.
  uint64_t PurgeExpired();

 private:
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  IdempotencyOptions              options_;
  util::NowFn                     now_;
};

} // namespace bay::idempotency
