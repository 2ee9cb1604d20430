#include "pg_pool.hpp"

namespace bay::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_sandbox",
               "SELECT id,owner,profile_id,workspace_id,expires_at_ms,deleted_at_ms,created_at_ms,last_active_at_ms "
               "FROM sandbox WHERE id=$1");

  conn.prepare("insert_sandbox",
               "INSERT INTO sandbox(id,owner,profile_id,workspace_id,expires_at_ms,deleted_at_ms,created_at_ms,last_active_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT DO NOTHING");

  conn.prepare("update_sandbox",
               "UPDATE sandbox SET owner=$2,profile_id=$3,workspace_id=$4,expires_at_ms=$5,deleted_at_ms=$6,last_active_at_ms=$7 "
               "WHERE id=$1");

  conn.prepare("get_session_by_sandbox",
               "SELECT id,sandbox_id,profile_id,runtime_type,desired_state,observed_state,instance_id,endpoint,"
               "idle_expires_at_ms,created_at_ms,last_active_at_ms,last_error FROM session WHERE sandbox_id=$1");

  conn.prepare("get_idempotency",
               "SELECT owner,key,fingerprint,response_snapshot,status_code,created_at_ms,expires_at_ms "
               "FROM idempotency_key WHERE owner=$1 AND key=$2");

  conn.prepare("insert_idempotency",
               "INSERT INTO idempotency_key(owner,key,fingerprint,response_snapshot,status_code,created_at_ms,expires_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7) ON CONFLICT DO NOTHING");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace bay::db::postgres
