#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace outbox::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::BootstrapSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const char* ddl : sql::kPostgresSchema) {
    tx.exec(ddl);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_process_manager", "INSERT INTO process_manager(id,type,state,version) VALUES($1,$2,$3,$4)");

  conn.prepare("update_process_manager", "UPDATE process_manager SET type=$2,state=$3,version=$4 WHERE id=$1 AND version=$5");

  conn.prepare("get_process_manager", "SELECT id,type,state,version FROM process_manager WHERE id=$1");

  conn.prepare("insert_pending_command",
               "INSERT INTO pending_command(process_manager_id,message_id,correlation_id,command_json) "
               "VALUES($1,$2,$3,$4) RETURNING id");

  conn.prepare("list_pending_commands",
               "SELECT id,process_manager_id,message_id,correlation_id,command_json "
               "FROM pending_command WHERE process_manager_id=$1 ORDER BY id ASC");

  conn.prepare("delete_pending_command", "DELETE FROM pending_command WHERE id=$1");

  conn.prepare("owners_with_pending_commands",
               "SELECT process_manager_id FROM pending_command GROUP BY process_manager_id ORDER BY MIN(id) LIMIT $1");

  conn.prepare("insert_pending_scheduled_command",
               "INSERT INTO pending_scheduled_command(process_manager_id,message_id,correlation_id,command_json,scheduled_time_ms) "
               "VALUES($1,$2,$3,$4,$5) RETURNING id");

  conn.prepare("list_pending_scheduled_commands",
               "SELECT id,process_manager_id,message_id,correlation_id,command_json,scheduled_time_ms "
               "FROM pending_scheduled_command WHERE process_manager_id=$1 ORDER BY id ASC");

  conn.prepare("delete_pending_scheduled_command", "DELETE FROM pending_scheduled_command WHERE id=$1");

  conn.prepare("owners_with_pending_scheduled_commands",
               "SELECT process_manager_id FROM pending_scheduled_command GROUP BY process_manager_id ORDER BY MIN(id) LIMIT $1");
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

} // namespace outbox::db::postgres
