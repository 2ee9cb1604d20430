#include "internal/idempotency/idempotency_ledger.hpp"

#include <stdexcept>
#include <utility>

#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/fingerprint.hpp"

namespace bay::idempotency {

using bay::core::ThrowIfDbError;
using bay::observability::StringField;

namespace {

constexpr std::size_t kMaxKeyLength = 128;

bool IsKeyChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

std::string FingerprintOf(const LedgerRequest& request) {
  return util::RequestFingerprint(request.method, request.path, request.body);
}

void ThrowIfMismatch(const db::model::IdempotencyRecord& record, const std::string& fingerprint) {
  if (record.fingerprint != fingerprint) {
    throw util::Conflict("idempotency key '" + record.key + "' was already used with a different request");
  }
}

} // namespace

IdempotencyLedger::IdempotencyLedger(std::shared_ptr<db::Repository> repository, IdempotencyOptions options, util::NowFn now)
    : repository_(std::move(repository)), options_(options), now_(std::move(now)) {
  if (!repository_) {
    throw std::invalid_argument("IdempotencyLedger: repository is required");
  }
}

uint64_t IdempotencyLedger::NowMs() const {
  return util::ToUnixMillis(now_());
}

void IdempotencyLedger::ValidateKey(const std::string& key) {
  if (key.empty() || key.size() > kMaxKeyLength) {
    throw util::ValidationError("idempotency key must be 1-128 characters");
  }
  for (char c : key) {
    if (!IsKeyChar(c)) {
      throw util::ValidationError("idempotency key may only contain letters, digits, '_' and '-'");
    }
  }
}

std::optional<CachedResponse> IdempotencyLedger::Check(const LedgerRequest& request) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetIdempotency(*tx, request.owner, request.key);
  if (!record) {
    tx->Commit();
    return std::nullopt;
  }

  if (record->expires_at_ms <= NowMs()) {
    ThrowIfDbError(repository_->DeleteIdempotency(*tx, request.owner, request.key), "idempotency: drop expired record");
    tx->Commit();
    return std::nullopt;
  }
  tx->Commit();

  ThrowIfMismatch(*record, FingerprintOf(request));
  return CachedResponse{record->response_snapshot, record->status_code};
}

CachedResponse IdempotencyLedger::Save(const LedgerRequest& request, const CachedResponse& response) {
  const auto now_ms = NowMs();

  db::model::IdempotencyRecord record;
  record.owner             = request.owner;
  record.key               = request.key;
  record.fingerprint       = FingerprintOf(request);
  record.response_snapshot = response.snapshot;
  record.status_code       = response.status_code;
  record.created_at_ms     = now_ms;
  record.expires_at_ms     = now_ms + static_cast<uint64_t>(options_.ttl.count()) * 1000;

  {
    auto       tx       = repository_->Begin();
    const auto inserted = repository_->InsertIdempotency(*tx, record);
    if (inserted) {
      tx->Commit();
      return response;
    }
    if (inserted.code != db::ErrorCode::AlreadyExists) {
      ThrowIfDbError(inserted, "idempotency: save");
    }
    tx->Rollback();
  }

  // Lost the race: the first writer's record is authoritative.
  auto tx     = repository_->Begin();
  auto winner = repository_->GetIdempotency(*tx, request.owner, request.key);
  if (!winner || winner->expires_at_ms <= now_ms) {
    if (winner) {
      ThrowIfDbError(repository_->DeleteIdempotency(*tx, request.owner, request.key), "idempotency: drop expired record");
    }
    ThrowIfDbError(repository_->InsertIdempotency(*tx, record), "idempotency: save");
    tx->Commit();
    return response;
  }
  tx->Commit();

  ThrowIfMismatch(*winner, record.fingerprint);
  BAY_LOG_DEBUG("idempotency: concurrent writer won", {StringField("owner", request.owner), StringField("key", request.key)});
  return CachedResponse{winner->response_snapshot, winner->status_code};
}

CachedResponse IdempotencyLedger::Execute(const LedgerRequest& request, const std::function<CachedResponse()>& operation) {
  if (!options_.enabled || request.key.empty()) {
    return operation();
  }

  ValidateKey(request.key);
  if (auto cached = Check(request)) {
    BAY_LOG_DEBUG("idempotency: replay", {StringField("owner", request.owner), StringField("key", request.key)});
    return *cached;
  }
  return Save(request, operation());
}

uint64_t IdempotencyLedger::PurgeExpired() {
  uint64_t deleted = 0;
  auto     tx      = repository_->Begin();
  ThrowIfDbError(repository_->DeleteExpiredIdempotency(*tx, NowMs(), &deleted), "idempotency: purge");
  tx->Commit();
  return deleted;
}

} // namespace bay::idempotency
