#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/adapter/grpc_runtime_adapter.hpp"
#include "internal/core/profile_registry.hpp"
#include "internal/core/retry_policy.hpp"
#include "internal/core/sandbox_manager.hpp"
#include "internal/core/workspace_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/driver/grpc_compute_driver.hpp"
#include "internal/gc/gc_tasks.hpp"
#include "internal/grpc/sandbox_server.hpp"
#include "internal/idempotency/idempotency_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/sandbox_service.hpp"
#include "internal/service/service_context.hpp"
#if BAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if BAY_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace bay::factory {

using namespace bay;
using bay::runtime::config::GcTaskConfig;
using bay::runtime::config::RuntimeConfig;

namespace {

#if BAY_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS sandbox (id TEXT PRIMARY KEY, owner TEXT NOT NULL, profile_id TEXT NOT NULL, workspace_id TEXT NOT NULL DEFAULT '', expires_at_ms INTEGER, deleted_at_ms INTEGER, created_at_ms INTEGER NOT NULL, last_active_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS sandbox_owner_idx ON sandbox(owner, id);",
      "CREATE INDEX IF NOT EXISTS sandbox_expires_idx ON sandbox(expires_at_ms) WHERE deleted_at_ms IS NULL;",
      "CREATE TABLE IF NOT EXISTS session (id TEXT PRIMARY KEY, sandbox_id TEXT NOT NULL UNIQUE REFERENCES sandbox(id), profile_id TEXT NOT NULL, runtime_type TEXT NOT NULL, desired_state INTEGER NOT NULL, observed_state INTEGER NOT NULL, instance_id TEXT NOT NULL DEFAULT '', endpoint TEXT NOT NULL DEFAULT '', idle_expires_at_ms INTEGER, created_at_ms INTEGER NOT NULL, last_active_at_ms INTEGER NOT NULL, last_error TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS workspace (id TEXT PRIMARY KEY, owner TEXT NOT NULL, volume_name TEXT NOT NULL, managed INTEGER NOT NULL, managed_by_sandbox_id TEXT NOT NULL DEFAULT '', size_limit_mb INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, last_accessed_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS idempotency_key (owner TEXT NOT NULL, key TEXT NOT NULL, fingerprint TEXT NOT NULL, response_snapshot BLOB NOT NULL, status_code INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, PRIMARY KEY (owner, key));",
      "CREATE INDEX IF NOT EXISTS idempotency_expires_idx ON idempotency_key(expires_at_ms);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,owner,profile_id,workspace_id,expires_at_ms,deleted_at_ms,created_at_ms,last_active_at_ms FROM sandbox LIMIT 1;");
  sqlite_db->Exec("SELECT id,sandbox_id,observed_state,instance_id,idle_expires_at_ms FROM session LIMIT 1;");
  sqlite_db->Exec("SELECT id,volume_name,managed,managed_by_sandbox_id FROM workspace LIMIT 1;");
  sqlite_db->Exec("SELECT owner,key,fingerprint,response_snapshot,expires_at_ms FROM idempotency_key LIMIT 1;");
}
#endif

#if BAY_DB_POSTGRES
// Runs on its own connection: pooled connections prepare statements against these tables.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);

  tx.exec("CREATE TABLE IF NOT EXISTS sandbox (id TEXT PRIMARY KEY, owner TEXT NOT NULL, profile_id TEXT NOT NULL, workspace_id TEXT NOT NULL DEFAULT '', expires_at_ms BIGINT, deleted_at_ms BIGINT, created_at_ms BIGINT NOT NULL, last_active_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS sandbox_owner_idx ON sandbox(owner, id);");
  tx.exec("CREATE TABLE IF NOT EXISTS session (id TEXT PRIMARY KEY, sandbox_id TEXT NOT NULL UNIQUE REFERENCES sandbox(id), profile_id TEXT NOT NULL, runtime_type TEXT NOT NULL, desired_state SMALLINT NOT NULL, observed_state SMALLINT NOT NULL, instance_id TEXT NOT NULL DEFAULT '', endpoint TEXT NOT NULL DEFAULT '', idle_expires_at_ms BIGINT, created_at_ms BIGINT NOT NULL, last_active_at_ms BIGINT NOT NULL, last_error TEXT NOT NULL DEFAULT '');");
  tx.exec("CREATE TABLE IF NOT EXISTS workspace (id TEXT PRIMARY KEY, owner TEXT NOT NULL, volume_name TEXT NOT NULL, managed BOOLEAN NOT NULL, managed_by_sandbox_id TEXT NOT NULL DEFAULT '', size_limit_mb INTEGER NOT NULL, created_at_ms BIGINT NOT NULL, last_accessed_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS idempotency_key (owner TEXT NOT NULL, key TEXT NOT NULL, fingerprint TEXT NOT NULL, response_snapshot TEXT NOT NULL, status_code INTEGER NOT NULL, created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, PRIMARY KEY (owner, key));");
  tx.exec("CREATE INDEX IF NOT EXISTS idempotency_expires_idx ON idempotency_key(expires_at_ms);");
  tx.commit();
}
#endif

std::chrono::milliseconds IntervalOf(const GcTaskConfig& task) {
  return std::chrono::seconds(task.interval_seconds());
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BAY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if BAY_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Record store
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  app.repository  = repository;

  // ------------------------------------------------------------------
  // External collaborators: compute driver, runtime adapters
  // ------------------------------------------------------------------
  auto driver_channel = ::grpc::CreateChannel(config.driver().endpoint(), ::grpc::InsecureChannelCredentials());
  auto driver = std::make_shared<driver::GrpcComputeDriver>(driver_channel, std::chrono::milliseconds(config.driver().timeout_ms()));

  auto       adapters        = std::make_shared<adapter::AdapterRegistry>();
  const auto runtime_timeout = std::chrono::milliseconds(config.runtime().timeout_ms());
  adapters->Register(adapter::GrpcRuntimeAdapter::kRuntimeType, [runtime_timeout](const std::string& endpoint) {
    return std::make_shared<adapter::GrpcRuntimeAdapter>(endpoint, runtime_timeout);
  });

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto profiles = std::make_shared<core::ProfileRegistry>(config);
  for (const auto& profile : config.profiles()) {
    if (!adapters->Supports(profile.runtime_type())) {
      throw std::runtime_error("Invalid configuration: profiles[" + profile.id() + "].runtime_type '" + profile.runtime_type() +
                               "' has no runtime adapter");
    }
  }

  core::WorkspaceOptions workspace_options;
  workspace_options.default_size_limit_mb = config.workspace().default_size_limit_mb();
  workspace_options.tag_namespace         = config.driver().tag_namespace();
  auto workspaces                         = std::make_shared<core::WorkspaceManager>(repository, driver, workspace_options);

  core::SandboxManagerOptions manager_options;
  manager_options.readiness      = core::RetryPolicy::FromConfig(config.sandbox().readiness(), manager_options.readiness);
  manager_options.retry_after_ms = config.sandbox().retry_after_ms();
  manager_options.max_extend     = std::chrono::seconds(config.sandbox().max_extend_seconds());
  manager_options.mount_path     = config.workspace().mount_path();
  manager_options.tag_namespace  = config.driver().tag_namespace();
  auto manager = std::make_shared<core::SandboxManager>(repository, driver, adapters, profiles, workspaces, manager_options);

  idempotency::IdempotencyOptions ledger_options;
  ledger_options.enabled = config.idempotency().enabled();
  ledger_options.ttl     = std::chrono::seconds(config.idempotency().ttl_seconds());
  auto ledger            = std::make_shared<idempotency::IdempotencyLedger>(repository, ledger_options);

  // ------------------------------------------------------------------
  // Garbage collection
  // ------------------------------------------------------------------
  const auto& gc_config  = config.gc();
  const auto  item_retry = core::RetryPolicy::FromConfig(gc_config.item_retry(), core::RetryPolicy{});
  app.gc                 = std::make_unique<gc::GcScheduler>();
  if (gc_config.enabled()) {
    if (gc_config.expired_sandbox().enabled()) {
      app.gc->AddTask(std::make_shared<gc::ExpiredSandboxGc>(repository, manager, item_retry), IntervalOf(gc_config.expired_sandbox()));
    }
    if (gc_config.idle_session().enabled()) {
      app.gc->AddTask(std::make_shared<gc::IdleSessionGc>(repository, manager, item_retry), IntervalOf(gc_config.idle_session()));
    }
    if (gc_config.stale_session().enabled()) {
      app.gc->AddTask(std::make_shared<gc::StaleSessionGc>(repository, manager, item_retry), IntervalOf(gc_config.stale_session()));
    }
    if (gc_config.orphan_workspace().enabled()) {
      app.gc->AddTask(std::make_shared<gc::OrphanWorkspaceGc>(workspaces, gc_config.include_external_workspaces(), item_retry),
                      IntervalOf(gc_config.orphan_workspace()));
    }
    if (gc_config.orphan_instance().enabled()) {
      app.gc->AddTask(std::make_shared<gc::OrphanInstanceGc>(repository, driver, config.driver().tag_namespace(), item_retry),
                      IntervalOf(gc_config.orphan_instance()));
    }
    if (gc_config.expired_idempotency().enabled()) {
      app.gc->AddTask(std::make_shared<gc::ExpiredIdempotencyGc>(ledger), IntervalOf(gc_config.expired_idempotency()));
    }
  }
  app.gc_run_on_startup = gc_config.enabled() && gc_config.run_on_startup();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager    = manager;
  ctx.workspaces = workspaces;
  ctx.ledger     = ledger;

  auto sandbox_service = std::make_shared<service::SandboxService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SandboxServer>(sandbox_service));

  BAY_LOG_INFO("application built", {observability::StringField("driver", config.driver().endpoint()),
                                     observability::IntField("profiles", config.profiles_size())});
  return app;
}

} // namespace bay::factory
