#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace cascade::db::postgres {

namespace {

constexpr const char* kOperationColumns =
    "container_id,operation_id,root_entity_id,root_entity_name,status,is_cascade,total_entities,deleted_count,failed_count,"
    "error_detail,created_by,created_at_ms,started_at_ms,completed_at_ms,expires_at_ms,version";

constexpr const char* kEntityColumns = "container_id,entity_id,parent_id,name,is_deleted,deleted_at_ms,deleted_by,expires_after_s";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
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

        std::unique_ptr<pqxx::connection> conn;
        try {
          conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
        return Wrap(conn.release());
      }

      cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
    }
  }
}

void PgPool::Bootstrap() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const char* sql : sql::kPostgresSchema) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string entity_columns    = kEntityColumns;
  const std::string operation_columns = kOperationColumns;

  conn.prepare("insert_container", "INSERT INTO containers(container_id,owner_id,name) VALUES($1,$2,$3)");
  conn.prepare("get_container", "SELECT container_id,owner_id,name FROM containers WHERE container_id=$1");

  conn.prepare("insert_entity", "INSERT INTO entities(" + entity_columns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
  conn.prepare("get_entity", "SELECT " + entity_columns + " FROM entities WHERE container_id=$1 AND entity_id=$2");
  conn.prepare("list_children",
               "SELECT " + entity_columns + " FROM entities WHERE container_id=$1 AND parent_id=$2 AND entity_id>$3 ORDER BY entity_id LIMIT $4");
  conn.prepare("has_live_children", "SELECT 1 FROM entities WHERE container_id=$1 AND parent_id=$2 AND NOT is_deleted LIMIT 1");
  conn.prepare("update_entity_deletion",
               "UPDATE entities SET is_deleted=$3,deleted_at_ms=$4,deleted_by=$5,expires_after_s=$6 WHERE container_id=$1 AND entity_id=$2");

  conn.prepare("insert_operation",
               "INSERT INTO delete_operations(" + operation_columns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)");
  conn.prepare("get_operation", "SELECT " + operation_columns + " FROM delete_operations WHERE container_id=$1 AND operation_id=$2");
  conn.prepare("update_operation",
               "UPDATE delete_operations SET status=$3,total_entities=$4,deleted_count=$5,failed_count=$6,error_detail=$7,"
               "started_at_ms=$8,completed_at_ms=$9,expires_at_ms=$10,version=$11+1 "
               "WHERE container_id=$1 AND operation_id=$2 AND version=$11");
  conn.prepare("list_failures",
               "SELECT entity_id FROM delete_operation_failures WHERE container_id=$1 AND operation_id=$2 ORDER BY entity_id");
  conn.prepare("clear_failures", "DELETE FROM delete_operation_failures WHERE container_id=$1 AND operation_id=$2");
  conn.prepare("insert_failure",
               "INSERT INTO delete_operation_failures(container_id,operation_id,entity_id) VALUES($1,$2,$3) ON CONFLICT DO NOTHING");
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

} // namespace cascade::db::postgres
