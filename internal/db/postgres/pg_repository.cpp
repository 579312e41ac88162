#include "pg_repository.hpp"

#include "cascade/manager/v1.hpp"

namespace cascade::db::postgres {

using cascade::manager::v1::DELETE_OPERATION_STATUS_COMPLETED;
using cascade::manager::v1::DELETE_OPERATION_STATUS_FAILED;
using cascade::manager::v1::DELETE_OPERATION_STATUS_IN_PROGRESS;
using cascade::manager::v1::DELETE_OPERATION_STATUS_PARTIAL;
using cascade::manager::v1::DELETE_OPERATION_STATUS_PENDING;
using cascade::manager::v1::DeleteOperationStatus;

namespace {

constexpr const char* kOperationColumns =
    "container_id,operation_id,root_entity_id,root_entity_name,status,is_cascade,total_entities,deleted_count,failed_count,"
    "error_detail,created_by,created_at_ms,started_at_ms,completed_at_ms,expires_at_ms,version";

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

model::EntityRecord ReadEntity(const pqxx::row& row) {
  model::EntityRecord r;
  r.container_id    = row[0].c_str();
  r.entity_id       = row[1].c_str();
  r.parent_id       = OptText(row[2]);
  r.name            = row[3].c_str();
  r.is_deleted      = row[4].as<bool>();
  r.deleted_at_ms   = OptU64(row[5]);
  r.deleted_by      = OptText(row[6]);
  r.expires_after_s = OptU64(row[7]);
  return r;
}

model::DeleteOperationRecord ReadOperation(const pqxx::row& row) {
  model::DeleteOperationRecord r;
  r.container_id     = row[0].c_str();
  r.operation_id     = row[1].c_str();
  r.root_entity_id   = row[2].c_str();
  r.root_entity_name = row[3].c_str();
  r.status           = static_cast<DeleteOperationStatus>(row[4].as<int>());
  r.cascade          = row[5].as<bool>();
  r.total_entities   = row[6].as<uint64_t>();
  r.deleted_count    = row[7].as<uint64_t>();
  r.failed_count     = row[8].as<uint64_t>();
  r.error_detail     = OptText(row[9]);
  r.created_by       = row[10].c_str();
  r.created_at_ms    = row[11].as<uint64_t>();
  r.started_at_ms    = OptU64(row[12]);
  r.completed_at_ms  = OptU64(row[13]);
  r.expires_at_ms    = row[14].as<uint64_t>();
  r.version          = row[15].as<uint64_t>();
  return r;
}

template <typename Tx>
void LoadFailures(Tx& tx, model::DeleteOperationRecord& r) {
  auto res = tx.exec_prepared("list_failures", r.container_id, r.operation_id);
  r.failed_entity_ids.clear();
  r.failed_entity_ids.reserve(res.size());
  for (const auto& row : res) {
    r.failed_entity_ids.emplace_back(row[0].c_str());
  }
}

template <typename Tx>
void WriteFailures(Tx& tx, const model::DeleteOperationRecord& r) {
  tx.exec_prepared("clear_failures", r.container_id, r.operation_id);
  for (const auto& entity_id : r.failed_entity_ids) {
    tx.exec_prepared("insert_failure", r.container_id, r.operation_id, entity_id);
  }
}

std::vector<model::DeleteOperationRecord> CollectOperations(pqxx::work& tx, const pqxx::result& res) {
  std::vector<model::DeleteOperationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadOperation(row));
  }
  for (auto& r : out) {
    LoadFailures(tx, r);
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Containers
// ------------------------------------------------------------------

Result PgRepository::InsertContainer(Transaction& t, const model::ContainerRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_container", r.container_id, r.owner_id, r.name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ContainerRecord> PgRepository::GetContainer(Transaction& t, const std::string& container_id) {
  auto res = TX(t).Work().exec_prepared("get_container", container_id);
  if (res.empty()) return std::nullopt;

  model::ContainerRecord r;
  r.container_id = res[0][0].c_str();
  r.owner_id     = res[0][1].c_str();
  r.name         = res[0][2].c_str();
  return r;
}

// ------------------------------------------------------------------
// Hierarchy
// ------------------------------------------------------------------

Result PgRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_entity", r.container_id, r.entity_id, r.parent_id, r.name, r.is_deleted, r.deleted_at_ms, r.deleted_by,
                               r.expires_after_s);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EntityRecord> PgRepository::GetEntity(Transaction& t, const std::string& container_id, const std::string& entity_id) {
  auto res = TX(t).Work().exec_prepared("get_entity", container_id, entity_id);
  if (res.empty()) return std::nullopt;
  return ReadEntity(res[0]);
}

std::vector<model::EntityRecord> PgRepository::ListChildren(Transaction& t, const std::string& container_id, const std::string& parent_id,
                                                            const std::string& after_entity_id, uint32_t limit) {
  auto res = TX(t).Work().exec_prepared("list_children", container_id, parent_id, after_entity_id, limit);

  std::vector<model::EntityRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEntity(row));
  }
  return out;
}

bool PgRepository::HasLiveChildren(Transaction& t, const std::string& container_id, const std::string& entity_id) {
  return !TX(t).Work().exec_prepared("has_live_children", container_id, entity_id).empty();
}

Result PgRepository::UpdateEntityDeletion(Transaction& t, const model::EntityRecord& r) {
  // A savepoint keeps one failed entity from aborting the caller's batch.
  try {
    pqxx::subtransaction sub(TX(t).Work(), "entity_deletion");
    auto res = sub.exec_prepared("update_entity_deletion", r.container_id, r.entity_id, r.is_deleted, r.deleted_at_ms, r.deleted_by,
                                 r.expires_after_s);
    if (res.affected_rows() == 0) {
      sub.abort();
      return Result::Err(ErrorCode::NotFound, "entity not found: " + r.entity_id);
    }
    sub.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Delete operation ledger
// ------------------------------------------------------------------

Result PgRepository::InsertOperation(Transaction& t, const model::DeleteOperationRecord& r) {
  try {
    auto& tx = TX(t).Work();
    tx.exec_prepared("insert_operation", r.container_id, r.operation_id, r.root_entity_id, r.root_entity_name, static_cast<int>(r.status),
                     r.cascade, r.total_entities, r.deleted_count, r.failed_count, r.error_detail, r.created_by, r.created_at_ms,
                     r.started_at_ms, r.completed_at_ms, r.expires_at_ms, r.version);
    WriteFailures(tx, r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeleteOperationRecord> PgRepository::GetOperation(Transaction& t, const std::string& container_id,
                                                                       const std::string& operation_id) {
  auto& tx   = TX(t).Work();
  auto  rows = CollectOperations(tx, tx.exec_prepared("get_operation", container_id, operation_id));
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result PgRepository::UpdateOperation(Transaction& t, model::DeleteOperationRecord& r) {
  try {
    auto& tx  = TX(t).Work();
    auto  res = tx.exec_prepared("update_operation", r.container_id, r.operation_id, static_cast<int>(r.status), r.total_entities,
                                 r.deleted_count, r.failed_count, r.error_detail, r.started_at_ms, r.completed_at_ms, r.expires_at_ms, r.version);
    if (res.affected_rows() == 0) {
      if (tx.exec_prepared("get_operation", r.container_id, r.operation_id).empty()) {
        return Result::Err(ErrorCode::NotFound, "operation not found: " + r.operation_id);
      }
      return Result::Err(ErrorCode::Conflict, "operation " + r.operation_id + " version " + std::to_string(r.version) + " is stale");
    }
    WriteFailures(tx, r);
    r.version += 1;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DeleteOperationRecord> PgRepository::ListOperationsByStatus(Transaction& t, DeleteOperationStatus status, uint32_t limit) {
  auto&             tx    = TX(t).Work();
  const std::string order = status == DELETE_OPERATION_STATUS_IN_PROGRESS ? " ORDER BY started_at_ms, created_at_ms" : " ORDER BY created_at_ms";
  auto res = tx.exec_params(std::string("SELECT ") + kOperationColumns + " FROM delete_operations WHERE status=$1" + order + " LIMIT $2;",
                            static_cast<int>(status), limit);
  return CollectOperations(tx, res);
}

std::vector<model::DeleteOperationRecord> PgRepository::ListRecentOperations(Transaction& t, const std::string& container_id,
                                                                             uint64_t created_after_ms, uint32_t limit) {
  auto& tx  = TX(t).Work();
  auto  res = tx.exec_params(std::string("SELECT ") + kOperationColumns +
                                " FROM delete_operations WHERE container_id=$1 AND created_at_ms>=$2 ORDER BY created_at_ms DESC LIMIT $3;",
                            container_id, created_after_ms, limit);
  return CollectOperations(tx, res);
}

void PgRepository::LockAdmission(Transaction& t, const std::string& container_id) {
  TX(t).Work().exec_params("SELECT pg_advisory_xact_lock(hashtext($1));", container_id);
}

uint64_t PgRepository::CountLiveOperations(Transaction& t, const std::string& container_id, const std::string& actor_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM delete_operations WHERE container_id=$1 AND created_by=$2 AND status IN ($3,$4);",
                                      container_id, actor_id, static_cast<int>(DELETE_OPERATION_STATUS_PENDING),
                                      static_cast<int>(DELETE_OPERATION_STATUS_IN_PROGRESS));
  return res[0][0].as<uint64_t>();
}

std::optional<model::DeleteOperationRecord> PgRepository::FindLiveOperationByRoot(Transaction& t, const std::string& container_id,
                                                                                  const std::string& root_entity_id) {
  auto& tx  = TX(t).Work();
  auto  res = tx.exec_params(std::string("SELECT ") + kOperationColumns +
                                " FROM delete_operations WHERE container_id=$1 AND root_entity_id=$2 AND status IN ($3,$4) "
                                "ORDER BY created_at_ms LIMIT 1;",
                            container_id, root_entity_id, static_cast<int>(DELETE_OPERATION_STATUS_PENDING),
                            static_cast<int>(DELETE_OPERATION_STATUS_IN_PROGRESS));
  auto rows = CollectOperations(tx, res);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

uint64_t PgRepository::DeleteExpiredOperations(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params("DELETE FROM delete_operations WHERE status IN ($1,$2,$3) AND expires_at_ms<=$4;",
                                      static_cast<int>(DELETE_OPERATION_STATUS_COMPLETED), static_cast<int>(DELETE_OPERATION_STATUS_PARTIAL),
                                      static_cast<int>(DELETE_OPERATION_STATUS_FAILED), now_ms);
  return static_cast<uint64_t>(res.affected_rows());
}

} // namespace cascade::db::postgres
