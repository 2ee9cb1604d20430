#include "internal/core/sandbox_manager.hpp"

#include <stdexcept>
#include <utility>

#include "internal/core/db_error.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace bay::core {

using bay::observability::DurationField;
using bay::observability::IntField;
using bay::observability::StringField;
using db::model::SandboxRecord;
using db::model::SessionRecord;

namespace {

constexpr uint32_t kDefaultListLimit = 50;
constexpr uint32_t kMaxListLimit     = 200;
constexpr uint64_t kDefaultIdleMs    = 1800 * 1000;

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

SandboxManager::SandboxManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<driver::ComputeDriver> driver,
                               std::shared_ptr<const adapter::AdapterRegistry> adapters, std::shared_ptr<const ProfileRegistry> profiles,
                               std::shared_ptr<WorkspaceManager> workspaces, SandboxManagerOptions options, util::NowFn now)
    : repository_(std::move(repository)),
      driver_(std::move(driver)),
      adapters_(std::move(adapters)),
      profiles_(std::move(profiles)),
      workspaces_(std::move(workspaces)),
      options_(std::move(options)),
      now_(std::move(now)) {
  if (!repository_ || !driver_ || !adapters_ || !profiles_ || !workspaces_) {
    throw std::invalid_argument("SandboxManager: repository, driver, adapters, profiles and workspaces are required");
  }
}

uint64_t SandboxManager::NowMs() const {
  return util::ToUnixMillis(now_());
}

uint64_t SandboxManager::IdleTimeoutMs(const std::string& profile_id) const {
  auto profile = profiles_->Find(profile_id);
  if (!profile || profile->idle_timeout_seconds() == 0) {
    return kDefaultIdleMs;
  }
  return static_cast<uint64_t>(profile->idle_timeout_seconds()) * 1000;
}

driver::Labels SandboxManager::InstanceLabels(const SandboxRecord& sandbox, const std::string& session_id) const {
  return {{driver::kManagedByLabel, options_.tag_namespace},
          {driver::kOwnerLabel, sandbox.owner},
          {driver::kSandboxLabel, sandbox.id},
          {driver::kSessionLabel, session_id},
          {driver::kWorkspaceLabel, sandbox.workspace_id},
          {driver::kProfileLabel, sandbox.profile_id}};
}

SandboxManager::Guard SandboxManager::Enter(const std::string& sandbox_id, const char* operation) {
  auto guard = locks_.Acquire(sandbox_id, options_.readiness.timeout);
  if (!guard) {
    throw util::SessionNotReady(std::string(operation) + ": sandbox " + sandbox_id + " is busy starting compute; retry later", sandbox_id,
                                options_.retry_after_ms);
  }
  return std::move(*guard);
}

SandboxRecord SandboxManager::LoadVisible(db::Transaction& tx, const std::string& owner, const std::string& sandbox_id, const char* operation) {
  auto sandbox = repository_->GetSandbox(tx, sandbox_id);
  if (!sandbox || sandbox->owner != owner || sandbox->deleted_at_ms) {
    throw util::NotFound(std::string(operation) + ": sandbox " + sandbox_id + " not found", sandbox_id);
  }
  return *sandbox;
}

void SandboxManager::ThrowIfExpired(const SandboxRecord& sandbox, uint64_t now_ms, const char* operation) const {
  if (model::HasExpired(sandbox.expires_at_ms, now_ms)) {
    throw util::SandboxExpired(std::string(operation) + ": sandbox " + sandbox.id + " expired; create a new sandbox", sandbox.id,
                               *sandbox.expires_at_ms);
  }
}

bay::v1::Sandbox SandboxManager::ToView(const SandboxRecord& sandbox, const std::optional<SessionRecord>& session, uint64_t now_ms) const {
  std::optional<bay::v1::SessionState> state;
  if (session) {
    state = session->observed_state;
  }

  bay::v1::Sandbox view;
  view.set_id(sandbox.id);
  view.set_status(model::DeriveStatus(sandbox.deleted_at_ms.has_value(), model::HasExpired(sandbox.expires_at_ms, now_ms), state));
  view.set_profile(sandbox.profile_id);
  view.set_workspace_id(sandbox.workspace_id);
  if (auto profile = profiles_->Find(sandbox.profile_id)) {
    for (const auto& capability : profile->capabilities()) {
      view.add_capabilities(capability);
    }
  }
  *view.mutable_created_at() = util::MillisToProto(sandbox.created_at_ms);
  if (sandbox.expires_at_ms) {
    *view.mutable_expires_at() = util::MillisToProto(*sandbox.expires_at_ms);
  }
  if (session && session->observed_state == bay::v1::SESSION_STATE_RUNNING && session->idle_expires_at_ms) {
    *view.mutable_idle_expires_at() = util::MillisToProto(*session->idle_expires_at_ms);
  }
  return view;
}

// ---------------------------------------------------------------------
// create / get / list
// ---------------------------------------------------------------------

bay::v1::Sandbox SandboxManager::Create(const std::string& owner, const std::string& profile_id, const std::string& workspace_id,
                                        int64_t ttl_seconds) {
  if (ttl_seconds < 0) {
    throw util::ValidationError("create sandbox: ttl_seconds must be >= 0 (0 means no expiry)");
  }
  const auto& profile = profiles_->Require(profile_id);
  if (!adapters_->Supports(profile.runtime_type())) {
    throw util::ValidationError("create sandbox: profile '" + profile.id() + "' uses unsupported runtime type '" + profile.runtime_type() + "'");
  }

  const auto    now_ms = NowMs();
  SandboxRecord sandbox;
  sandbox.id                = util::NewSandboxId();
  sandbox.owner             = owner;
  sandbox.profile_id        = profile.id();
  sandbox.created_at_ms     = now_ms;
  sandbox.last_active_at_ms = now_ms;
  if (ttl_seconds > 0) {
    sandbox.expires_at_ms = now_ms + static_cast<uint64_t>(ttl_seconds) * 1000;
  }

  std::optional<db::model::WorkspaceRecord> managed;
  std::optional<lock::SandboxLockTable::Guard> binding;
  if (workspace_id.empty()) {
    managed              = workspaces_->ProvisionManaged(owner, sandbox.id);
    sandbox.workspace_id = managed->id;
  } else {
    // held until the sandbox row is committed so a concurrent delete sees the reference
    binding.emplace(workspaces_->EnterWorkspace(workspace_id));
    sandbox.workspace_id = workspace_id;
  }

  try {
    auto tx = repository_->Begin();
    if (managed) {
      ThrowIfDbError(repository_->InsertWorkspace(*tx, *managed), "create sandbox: insert workspace");
    } else {
      auto workspace = repository_->GetWorkspace(*tx, workspace_id);
      if (!workspace || workspace->owner != owner) {
        throw util::NotFound("create sandbox: workspace " + workspace_id + " not found");
      }
      if (workspace->managed) {
        throw util::ValidationError("create sandbox: workspace " + workspace_id + " is managed by another sandbox");
      }
    }
    ThrowIfDbError(repository_->InsertSandbox(*tx, sandbox), "create sandbox");
    tx->Commit();
  } catch (const std::exception&) {
    if (managed) {
      workspaces_->DiscardVolume(managed->volume_name);
    }
    throw;
  }

  BAY_LOG_INFO("sandbox created",
               {StringField("sandbox_id", sandbox.id), StringField("owner", owner), StringField("profile", sandbox.profile_id),
                StringField("workspace_id", sandbox.workspace_id), IntField("ttl_seconds", ttl_seconds)});
  return ToView(sandbox, std::nullopt, now_ms);
}

bay::v1::Sandbox SandboxManager::Get(const std::string& owner, const std::string& sandbox_id) {
  auto tx      = repository_->Begin();
  auto sandbox = LoadVisible(*tx, owner, sandbox_id, "get sandbox");
  auto session = repository_->GetSessionBySandbox(*tx, sandbox_id);
  tx->Commit();
  return ToView(sandbox, session, NowMs());
}

SandboxListing SandboxManager::List(const std::string& owner, std::optional<bay::v1::SandboxStatus> status, uint32_t limit,
                                    const std::string& cursor) {
  if (limit == 0) {
    limit = kDefaultListLimit;
  }
  if (limit > kMaxListLimit) {
    throw util::ValidationError("list sandboxes: limit must be between 1 and " + std::to_string(kMaxListLimit));
  }

  SandboxListing listing;
  std::string    after  = cursor;
  const auto     now_ms = NowMs();

  // A status filter may drop rows, so keep scanning pages until the listing is full.
  for (;;) {
    std::vector<std::pair<SandboxRecord, std::optional<SessionRecord>>> rows;
    {
      auto tx   = repository_->Begin();
      auto page = repository_->ListSandboxes(*tx, db::SandboxPage{owner, after, limit});
      rows.reserve(page.size());
      for (auto& record : page) {
        auto session = repository_->GetSessionBySandbox(*tx, record.id);
        rows.emplace_back(std::move(record), std::move(session));
      }
      tx->Commit();
    }

    for (std::size_t i = 0; i < rows.size(); ++i) {
      const auto& [record, session] = rows[i];
      after                         = record.id;
      auto view                     = ToView(record, session, now_ms);
      if (status && view.status() != *status) {
        continue;
      }
      listing.items.push_back(std::move(view));
      if (listing.items.size() == limit) {
        const bool more      = i + 1 < rows.size() || rows.size() == limit;
        listing.next_cursor = more ? after : std::string();
        return listing;
      }
    }

    if (rows.size() < limit) {
      return listing;
    }
  }
}

// ---------------------------------------------------------------------
// ensure_running
// ---------------------------------------------------------------------

SessionHandle SandboxManager::HandleFor(const SessionRecord& session) {
  std::shared_ptr<adapter::RuntimeAdapter> adapter;
  {
    std::lock_guard<std::mutex> lock(adapters_mutex_);
    auto&                       cached = session_adapters_[session.id];
    if (!cached) {
      cached = adapters_->Create(session.runtime_type, session.endpoint);
    }
    adapter = cached;
  }
  return SessionHandle{session.id, session.endpoint, session.runtime_type, std::move(adapter)};
}

SessionHandle SandboxManager::EnsureRunning(const std::string& owner, const std::string& sandbox_id) {
  // Fast path: a healthy session already exists. Counts as activity.
  {
    const auto now_ms  = NowMs();
    auto       tx      = repository_->Begin();
    auto       sandbox = LoadVisible(*tx, owner, sandbox_id, "ensure running");
    ThrowIfExpired(sandbox, now_ms, "ensure running");
    auto session = repository_->GetSessionBySandbox(*tx, sandbox_id);
    if (session && session->observed_state == bay::v1::SESSION_STATE_RUNNING && session->idle_expires_at_ms &&
        *session->idle_expires_at_ms >= now_ms) {
      session->idle_expires_at_ms = now_ms + IdleTimeoutMs(session->profile_id);
      session->last_active_at_ms  = now_ms;
      ThrowIfDbError(repository_->UpdateSession(*tx, *session), "ensure running: refresh idle deadline");
      tx->Commit();
      return HandleFor(*session);
    }
    tx->Commit();
  }

  const auto seen  = locks_.Generation(sandbox_id);
  auto       guard = Enter(sandbox_id, "ensure running");
  if (auto failure = guard.FailureSince(seen)) {
    // The start we queued behind failed; report that instead of starting again.
    std::rethrow_exception(failure);
  }

  // Re-read under the section: the winner may have started compute, or the sandbox may be gone.
  const auto                   now_ms = NowMs();
  SandboxRecord                sandbox;
  std::optional<SessionRecord> stale;
  {
    auto tx = repository_->Begin();
    sandbox = LoadVisible(*tx, owner, sandbox_id, "ensure running");
    ThrowIfExpired(sandbox, now_ms, "ensure running");
    auto session = repository_->GetSessionBySandbox(*tx, sandbox_id);
    if (session && session->observed_state == bay::v1::SESSION_STATE_RUNNING) {
      session->idle_expires_at_ms = now_ms + IdleTimeoutMs(session->profile_id);
      session->last_active_at_ms  = now_ms;
      ThrowIfDbError(repository_->UpdateSession(*tx, *session), "ensure running: adopt session");
      tx->Commit();
      return HandleFor(*session);
    }
    tx->Commit();
    stale = std::move(session);
  }

  // Failed or abandoned attempt: clear it out before starting fresh.
  if (stale) {
    TeardownSession(*stale);
  }

  return StartSession(guard, sandbox);
}

SessionHandle SandboxManager::StartSession(Guard& guard, const SandboxRecord& sandbox) {
  const auto& profile = profiles_->Require(sandbox.profile_id);

  SessionRecord session;
  session.id                = util::NewSessionId();
  session.sandbox_id        = sandbox.id;
  session.profile_id        = profile.id();
  session.runtime_type      = profile.runtime_type();
  session.desired_state     = bay::v1::SESSION_STATE_RUNNING;
  session.observed_state    = bay::v1::SESSION_STATE_PENDING;
  session.created_at_ms     = NowMs();
  session.last_active_at_ms = session.created_at_ms;
  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertSession(*tx, session), "ensure running: insert session");
    tx->Commit();
  }

  observability::SpanScope span("bay.session.start");
  span.SetAttribute("sandbox_id", sandbox.id);
  span.SetAttribute("session_id", session.id);
  const auto started = std::chrono::steady_clock::now();

  try {
    std::string volume_name;
    if (!sandbox.workspace_id.empty()) {
      auto tx        = repository_->Begin();
      auto workspace = repository_->GetWorkspace(*tx, sandbox.workspace_id);
      tx->Commit();
      if (!workspace) {
        throw util::NotFound("ensure running: workspace " + sandbox.workspace_id + " of sandbox " + sandbox.id + " is gone", sandbox.id);
      }
      volume_name = workspace->volume_name;
    }

    auto instance          = driver_->Start(driver::InstanceRequest{profile, volume_name, options_.mount_path, InstanceLabels(sandbox, session.id)});
    session.instance_id    = instance.instance_id;
    session.endpoint       = instance.endpoint;
    session.observed_state = bay::v1::SESSION_STATE_STARTING;
    {
      auto tx = repository_->Begin();
      ThrowIfDbError(repository_->UpdateSession(*tx, session), "ensure running: record instance");
      tx->Commit();
    }
    span.AddEvent("instance_started");

    auto adapter = adapters_->Create(session.runtime_type, session.endpoint);
    if (!PollUntil(options_.readiness, [&adapter] { return adapter->Healthy(); })) {
      throw util::Timeout("ensure running: runtime of sandbox " + sandbox.id + " not healthy within " +
                              std::to_string(options_.readiness.timeout.count()) + "ms",
                          sandbox.id);
    }

    const auto ready_ms         = NowMs();
    session.observed_state      = bay::v1::SESSION_STATE_RUNNING;
    session.idle_expires_at_ms  = ready_ms + IdleTimeoutMs(profile.id());
    session.last_active_at_ms   = ready_ms;
    session.last_error.clear();
    {
      auto tx = repository_->Begin();
      ThrowIfDbError(repository_->UpdateSession(*tx, session), "ensure running: mark running");
      tx->Commit();
    }
    {
      std::lock_guard<std::mutex> lock(adapters_mutex_);
      session_adapters_[session.id] = adapter;
    }

    guard.PublishSuccess();
    const auto elapsed = ElapsedMs(started);
    observability::Metrics::Instance().ObserveSessionStartMs(profile.id(), elapsed, true);
    BAY_LOG_INFO("session running",
                 {StringField("sandbox_id", sandbox.id), StringField("session_id", session.id), StringField("instance_id", session.instance_id),
                  DurationField("startup", std::chrono::milliseconds(static_cast<int64_t>(elapsed)))});
    return SessionHandle{session.id, session.endpoint, session.runtime_type, std::move(adapter)};
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    MarkFailed(session, e.what());
    guard.PublishFailure(std::current_exception());
    observability::Metrics::Instance().ObserveSessionStartMs(profile.id(), ElapsedMs(started), false);
    BAY_LOG_WARN("session start failed", {StringField("sandbox_id", sandbox.id), StringField("session_id", session.id), StringField("error", e.what())});
    throw;
  }
}

void SandboxManager::MarkFailed(SessionRecord session, const std::string& error) noexcept {
  try {
    if (!session.instance_id.empty()) {
      try {
        driver_->Destroy(session.instance_id);
        session.instance_id.clear();
        session.endpoint.clear();
      } catch (const std::exception& e) {
        BAY_LOG_WARN("instance destroy after failed start did not succeed; left for orphan reconciliation",
                     {StringField("instance_id", session.instance_id), StringField("error", e.what())});
      }
    }

    session.desired_state  = bay::v1::SESSION_STATE_STOPPED;
    session.observed_state = bay::v1::SESSION_STATE_FAILED;
    session.idle_expires_at_ms.reset();
    session.last_error = error;

    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpdateSession(*tx, session), "record session failure");
    tx->Commit();
  } catch (const std::exception& e) {
    BAY_LOG_ERROR("could not record session failure", {StringField("session_id", session.id), StringField("error", e.what())});
  }
}

// ---------------------------------------------------------------------
// keepalive / stop / delete / extend_ttl
// ---------------------------------------------------------------------

void SandboxManager::Keepalive(const std::string& owner, const std::string& sandbox_id) {
  const auto now_ms  = NowMs();
  auto       tx      = repository_->Begin();
  auto       sandbox = LoadVisible(*tx, owner, sandbox_id, "keepalive");
  ThrowIfExpired(sandbox, now_ms, "keepalive");

  sandbox.last_active_at_ms = now_ms;
  ThrowIfDbError(repository_->UpdateSandbox(*tx, sandbox), "keepalive");

  // Only pushes the idle deadline of running compute; never starts any.
  auto session = repository_->GetSessionBySandbox(*tx, sandbox_id);
  if (session && session->observed_state == bay::v1::SESSION_STATE_RUNNING) {
    session->idle_expires_at_ms = now_ms + IdleTimeoutMs(session->profile_id);
    session->last_active_at_ms  = now_ms;
    ThrowIfDbError(repository_->UpdateSession(*tx, *session), "keepalive: session");
  }
  tx->Commit();
}

void SandboxManager::TeardownSession(const std::string& sandbox_id) {
  std::optional<SessionRecord> session;
  {
    auto tx = repository_->Begin();
    session = repository_->GetSessionBySandbox(*tx, sandbox_id);
    tx->Commit();
  }
  if (session) {
    TeardownSession(*session);
  }
}

void SandboxManager::TeardownSession(const SessionRecord& session) {
  {
    std::lock_guard<std::mutex> lock(adapters_mutex_);
    session_adapters_.erase(session.id);
  }

  if (!session.instance_id.empty()) {
    if (session.observed_state != bay::v1::SESSION_STATE_STOPPING) {
      auto stopping           = session;
      stopping.desired_state  = bay::v1::SESSION_STATE_STOPPED;
      stopping.observed_state = bay::v1::SESSION_STATE_STOPPING;
      stopping.idle_expires_at_ms.reset();
      auto tx = repository_->Begin();
      ThrowIfDbError(repository_->UpdateSession(*tx, stopping), "stop session");
      tx->Commit();
    }
    driver_->Destroy(session.instance_id);
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteSession(*tx, session.id), "remove session");
  tx->Commit();

  BAY_LOG_INFO("session removed", {StringField("sandbox_id", session.sandbox_id), StringField("session_id", session.id),
                                   StringField("instance_id", session.instance_id)});
}

void SandboxManager::Stop(const std::string& owner, const std::string& sandbox_id) {
  auto guard = Enter(sandbox_id, "stop sandbox");
  {
    auto tx = repository_->Begin();
    LoadVisible(*tx, owner, sandbox_id, "stop sandbox");
    tx->Commit();
  }
  TeardownSession(sandbox_id);
}

void SandboxManager::SoftDelete(const std::string& sandbox_id) {
  std::optional<db::model::WorkspaceRecord> managed;
  {
    auto tx      = repository_->Begin();
    auto sandbox = repository_->GetSandbox(*tx, sandbox_id);
    if (!sandbox || sandbox->deleted_at_ms) {
      tx->Commit();
      return;
    }
    sandbox->deleted_at_ms = NowMs();
    ThrowIfDbError(repository_->UpdateSandbox(*tx, *sandbox), "delete sandbox");
    if (!sandbox->workspace_id.empty()) {
      auto workspace = repository_->GetWorkspace(*tx, sandbox->workspace_id);
      if (workspace && workspace->managed && workspace->managed_by_sandbox_id == sandbox_id) {
        managed = std::move(workspace);
      }
    }
    tx->Commit();
  }

  BAY_LOG_INFO("sandbox deleted", {StringField("sandbox_id", sandbox_id)});

  if (!managed) {
    return;
  }
  try {
    workspaces_->Reclaim(*managed);
  } catch (const std::exception& e) {
    BAY_LOG_WARN("managed workspace cleanup failed; left for orphan reconciliation",
                 {StringField("sandbox_id", sandbox_id), StringField("workspace_id", managed->id), StringField("error", e.what())});
  }
}

void SandboxManager::Delete(const std::string& owner, const std::string& sandbox_id) {
  {
    auto guard = Enter(sandbox_id, "delete sandbox");
    {
      auto tx = repository_->Begin();
      LoadVisible(*tx, owner, sandbox_id, "delete sandbox");
      tx->Commit();
    }
    TeardownSession(sandbox_id);
    SoftDelete(sandbox_id);
  }
  locks_.Prune(sandbox_id);
}

bay::v1::Sandbox SandboxManager::ExtendTtl(const std::string& owner, const std::string& sandbox_id, int64_t extend_by_seconds) {
  if (extend_by_seconds <= 0) {
    throw util::ValidationError("extend ttl: extend_by_seconds must be > 0");
  }
  if (extend_by_seconds > options_.max_extend.count()) {
    throw util::ValidationError("extend ttl: extend_by_seconds must be <= " + std::to_string(options_.max_extend.count()));
  }

  // No section here: concurrent extensions may race, last writer wins.
  const auto now_ms  = NowMs();
  auto       tx      = repository_->Begin();
  auto       sandbox = LoadVisible(*tx, owner, sandbox_id, "extend ttl");
  if (!sandbox.expires_at_ms) {
    throw util::SandboxTtlInfinite("extend ttl: sandbox " + sandbox_id + " has no expiry to extend", sandbox_id);
  }
  ThrowIfExpired(sandbox, now_ms, "extend ttl");

  sandbox.expires_at_ms = model::ExtendedExpiry(*sandbox.expires_at_ms, now_ms, static_cast<uint64_t>(extend_by_seconds) * 1000);
  ThrowIfDbError(repository_->UpdateSandbox(*tx, sandbox), "extend ttl");
  auto session = repository_->GetSessionBySandbox(*tx, sandbox_id);
  tx->Commit();

  BAY_LOG_INFO("sandbox ttl extended", {StringField("sandbox_id", sandbox_id), IntField("expires_at_ms", static_cast<int64_t>(*sandbox.expires_at_ms))});
  return ToView(sandbox, session, now_ms);
}

// ---------------------------------------------------------------------
// reconciliation
// ---------------------------------------------------------------------

bool SandboxManager::ReclaimExpired(const std::string& sandbox_id) {
  {
    auto guard = locks_.TryAcquire(sandbox_id);
    if (!guard) {
      return false;
    }

    {
      auto tx      = repository_->Begin();
      auto sandbox = repository_->GetSandbox(*tx, sandbox_id);
      tx->Commit();
      if (!sandbox || sandbox->deleted_at_ms || !model::HasExpired(sandbox->expires_at_ms, NowMs())) {
        return false;
      }
    }

    TeardownSession(sandbox_id);
    SoftDelete(sandbox_id);
  }
  locks_.Prune(sandbox_id);
  return true;
}

bool SandboxManager::ReclaimIdleSession(const std::string& sandbox_id) {
  auto guard = locks_.TryAcquire(sandbox_id);
  if (!guard) {
    return false;
  }

  std::optional<SessionRecord> session;
  {
    auto tx = repository_->Begin();
    session = repository_->GetSessionBySandbox(*tx, sandbox_id);
    tx->Commit();
  }
  if (!session || session->observed_state != bay::v1::SESSION_STATE_RUNNING || !session->idle_expires_at_ms ||
      *session->idle_expires_at_ms >= NowMs()) {
    return false;
  }

  TeardownSession(*session);
  return true;
}

bool SandboxManager::ReclaimStaleStart(const std::string& sandbox_id) {
  auto guard = locks_.TryAcquire(sandbox_id);
  if (!guard) {
    return false;
  }

  std::optional<SessionRecord> session;
  {
    auto tx = repository_->Begin();
    session = repository_->GetSessionBySandbox(*tx, sandbox_id);
    tx->Commit();
  }
  if (!session ||
      (session->observed_state != bay::v1::SESSION_STATE_PENDING && session->observed_state != bay::v1::SESSION_STATE_STARTING) ||
      session->created_at_ms + static_cast<uint64_t>(options_.readiness.timeout.count()) >= NowMs()) {
    return false;
  }

  BAY_LOG_WARN("abandoned session start", {StringField("sandbox_id", sandbox_id), StringField("session_id", session->id),
                                           StringField("instance_id", session->instance_id)});
  TeardownSession(*session);
  return true;
}

} // namespace bay::core
