#include "pg_pool.hpp"

#include <exception>

namespace fleetq::db::postgres {

namespace {

constexpr const char* kTaskReturning =
    " RETURNING id,item_id,status,worker_id,attempts,max_attempts,created_at_ms,last_attempt_at_ms,completed_at_ms";

constexpr const char* kProxyReturning =
    " RETURNING id,proxy,status,locked_by,locked_at_ms,uses_count,blocks_count,last_used_at_ms,created_at_ms";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("claim_task",
               std::string("UPDATE tasks SET status='processing', worker_id=$1, last_attempt_at_ms=$2 "
                           "WHERE id=(SELECT id FROM tasks WHERE status='pending' "
                           "ORDER BY created_at_ms, id LIMIT 1 FOR UPDATE SKIP LOCKED)") +
                   kTaskReturning);

  conn.prepare("complete_task",
               std::string("UPDATE tasks SET status='completed', completed_at_ms=$3, worker_id=NULL "
                           "WHERE id=$1 AND status='processing' AND worker_id=$2") +
                   kTaskReturning);

  conn.prepare("fail_task_attempt",
               std::string("UPDATE tasks SET attempts=attempts+1, "
                           "status=CASE WHEN attempts+1>=max_attempts THEN 'failed' ELSE 'pending' END, "
                           "worker_id=NULL "
                           "WHERE id=$1 AND status='processing' AND worker_id=$2") +
                   kTaskReturning);

  conn.prepare("return_task",
               std::string("UPDATE tasks SET status='pending', worker_id=NULL "
                           "WHERE id=$1 AND status='processing' AND worker_id=$2") +
                   kTaskReturning);

  conn.prepare("claim_proxy",
               std::string("UPDATE proxies SET status='locked', locked_by=$1, locked_at_ms=$2, "
                           "uses_count=uses_count+1, last_used_at_ms=$2 "
                           "WHERE id=(SELECT id FROM proxies WHERE status='available' "
                           "ORDER BY blocks_count, uses_count, id LIMIT 1 FOR UPDATE SKIP LOCKED)") +
                   kProxyReturning);

  conn.prepare("claim_proxy_by_id",
               std::string("UPDATE proxies SET status='locked', locked_by=$2, locked_at_ms=$3, "
                           "uses_count=uses_count+1, last_used_at_ms=$3 "
                           "WHERE id=(SELECT id FROM proxies WHERE id=$1 AND status='available' "
                           "FOR UPDATE SKIP LOCKED)") +
                   kProxyReturning);

  conn.prepare("release_proxy",
               std::string("UPDATE proxies SET status='available', locked_by=NULL, locked_at_ms=NULL, "
                           "last_used_at_ms=$3 "
                           "WHERE id=$1 AND status='locked' AND locked_by=$2") +
                   kProxyReturning);

  conn.prepare("block_proxy",
               std::string("UPDATE proxies SET blocks_count=blocks_count+1, "
                           "status=CASE WHEN blocks_count+1>=$3 THEN 'blocked' ELSE 'available' END, "
                           "locked_by=NULL, locked_at_ms=NULL, last_used_at_ms=$4 "
                           "WHERE id=$1 AND (status='available' OR (status='locked' AND locked_by=$2))") +
                   kProxyReturning);

  conn.prepare("touch_worker",
               "UPDATE workers SET status='active', last_heartbeat_ms=GREATEST(last_heartbeat_ms, $2) "
               "WHERE worker_id=$1");
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
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace fleetq::db::postgres
