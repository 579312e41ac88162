#pragma once

#include <array>

namespace cascade::db::sql {

/*
  Bootstrap DDL per backend. Every statement is idempotent.

  delete_operation_failures holds the failed_entity_ids set of each
  operation; it is rewritten with the operation row on every update.
*/

inline constexpr std::array<const char*, 7> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS containers (container_id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, name TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS entities (container_id TEXT NOT NULL, entity_id TEXT NOT NULL, parent_id TEXT, name TEXT NOT NULL, "
    "is_deleted INTEGER NOT NULL DEFAULT 0, deleted_at_ms INTEGER, deleted_by TEXT, expires_after_s INTEGER, PRIMARY KEY (container_id, entity_id));",
    "CREATE INDEX IF NOT EXISTS entities_by_parent ON entities (container_id, parent_id, entity_id);",
    "CREATE TABLE IF NOT EXISTS delete_operations (container_id TEXT NOT NULL, operation_id TEXT NOT NULL, root_entity_id TEXT NOT NULL, "
    "root_entity_name TEXT NOT NULL, status INTEGER NOT NULL, is_cascade INTEGER NOT NULL, total_entities INTEGER NOT NULL, "
    "deleted_count INTEGER NOT NULL, failed_count INTEGER NOT NULL, error_detail TEXT, created_by TEXT NOT NULL, created_at_ms INTEGER NOT NULL, "
    "started_at_ms INTEGER, completed_at_ms INTEGER, expires_at_ms INTEGER NOT NULL, version INTEGER NOT NULL, "
    "PRIMARY KEY (container_id, operation_id));",
    "CREATE INDEX IF NOT EXISTS delete_operations_by_status ON delete_operations (status, created_at_ms);",
    "CREATE INDEX IF NOT EXISTS delete_operations_by_actor ON delete_operations (container_id, created_by, status);",
    "CREATE TABLE IF NOT EXISTS delete_operation_failures (container_id TEXT NOT NULL, operation_id TEXT NOT NULL, entity_id TEXT NOT NULL, "
    "PRIMARY KEY (container_id, operation_id, entity_id), FOREIGN KEY (container_id, operation_id) "
    "REFERENCES delete_operations (container_id, operation_id) ON DELETE CASCADE);",
};

inline constexpr std::array<const char*, 7> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS containers (container_id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, name TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS entities (container_id TEXT NOT NULL, entity_id TEXT NOT NULL, parent_id TEXT, name TEXT NOT NULL, "
    "is_deleted BOOLEAN NOT NULL DEFAULT FALSE, deleted_at_ms BIGINT, deleted_by TEXT, expires_after_s BIGINT, PRIMARY KEY (container_id, entity_id));",
    "CREATE INDEX IF NOT EXISTS entities_by_parent ON entities (container_id, parent_id, entity_id);",
    "CREATE TABLE IF NOT EXISTS delete_operations (container_id TEXT NOT NULL, operation_id TEXT NOT NULL, root_entity_id TEXT NOT NULL, "
    "root_entity_name TEXT NOT NULL, status SMALLINT NOT NULL, is_cascade BOOLEAN NOT NULL, total_entities BIGINT NOT NULL, "
    "deleted_count BIGINT NOT NULL, failed_count BIGINT NOT NULL, error_detail TEXT, created_by TEXT NOT NULL, created_at_ms BIGINT NOT NULL, "
    "started_at_ms BIGINT, completed_at_ms BIGINT, expires_at_ms BIGINT NOT NULL, version BIGINT NOT NULL, "
    "PRIMARY KEY (container_id, operation_id));",
    "CREATE INDEX IF NOT EXISTS delete_operations_by_status ON delete_operations (status, created_at_ms);",
    "CREATE INDEX IF NOT EXISTS delete_operations_by_actor ON delete_operations (container_id, created_by, status);",
    "CREATE TABLE IF NOT EXISTS delete_operation_failures (container_id TEXT NOT NULL, operation_id TEXT NOT NULL, entity_id TEXT NOT NULL, "
    "PRIMARY KEY (container_id, operation_id, entity_id), FOREIGN KEY (container_id, operation_id) "
    "REFERENCES delete_operations (container_id, operation_id) ON DELETE CASCADE);",
};

} // namespace cascade::db::sql
