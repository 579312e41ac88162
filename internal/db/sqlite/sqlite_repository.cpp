#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "cascade/manager/v1.hpp"

namespace cascade::db::sqlite {

using cascade::db::ErrorCode;
using cascade::db::Result;
using cascade::manager::v1::DELETE_OPERATION_STATUS_COMPLETED;
using cascade::manager::v1::DELETE_OPERATION_STATUS_FAILED;
using cascade::manager::v1::DELETE_OPERATION_STATUS_IN_PROGRESS;
using cascade::manager::v1::DELETE_OPERATION_STATUS_PARTIAL;
using cascade::manager::v1::DELETE_OPERATION_STATUS_PENDING;
using cascade::manager::v1::DeleteOperationStatus;

namespace {

constexpr const char* kEntityColumns = "container_id,entity_id,parent_id,name,is_deleted,deleted_at_ms,deleted_by,expires_after_s";

constexpr const char* kOperationColumns =
    "container_id,operation_id,root_entity_id,root_entity_name,status,is_cascade,total_entities,deleted_count,failed_count,"
    "error_detail,created_by,created_at_ms,started_at_ms,completed_at_ms,expires_at_ms,version";

// Owns a prepared statement for the duration of one call.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Prepared() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  int PrepareCode() const {
    return rc_;
  }

  // Reads have no Result channel; a statement that cannot be prepared is a
  // schema bug or a broken connection.
  void RequirePrepared() const {
    if (!Prepared()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
  }

  sqlite3_stmt* Get() const {
    return st_;
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::EntityRecord ReadEntity(sqlite3_stmt* st) {
  model::EntityRecord r;
  r.container_id    = ColText(st, 0);
  r.entity_id       = ColText(st, 1);
  r.parent_id       = ColOptText(st, 2);
  r.name            = ColText(st, 3);
  r.is_deleted      = ColI32(st, 4) != 0;
  r.deleted_at_ms   = ColOptU64(st, 5);
  r.deleted_by      = ColOptText(st, 6);
  r.expires_after_s = ColOptU64(st, 7);
  return r;
}

model::DeleteOperationRecord ReadOperation(sqlite3_stmt* st) {
  model::DeleteOperationRecord r;
  r.container_id     = ColText(st, 0);
  r.operation_id     = ColText(st, 1);
  r.root_entity_id   = ColText(st, 2);
  r.root_entity_name = ColText(st, 3);
  r.status           = static_cast<DeleteOperationStatus>(ColI32(st, 4));
  r.cascade          = ColI32(st, 5) != 0;
  r.total_entities   = ColU64(st, 6);
  r.deleted_count    = ColU64(st, 7);
  r.failed_count     = ColU64(st, 8);
  r.error_detail     = ColOptText(st, 9);
  r.created_by       = ColText(st, 10);
  r.created_at_ms    = ColU64(st, 11);
  r.started_at_ms    = ColOptU64(st, 12);
  r.completed_at_ms  = ColOptU64(st, 13);
  r.expires_at_ms    = ColU64(st, 14);
  r.version          = ColU64(st, 15);
  return r;
}

void LoadFailures(sqlite3* db, model::DeleteOperationRecord& r) {
  Statement st(db, "SELECT entity_id FROM delete_operation_failures WHERE container_id=? AND operation_id=? ORDER BY rowid;");
  st.RequirePrepared();
  BindText(st.Get(), 1, r.container_id);
  BindText(st.Get(), 2, r.operation_id);

  r.failed_entity_ids.clear();
  while (sqlite3_step(st.Get()) == SQLITE_ROW) {
    r.failed_entity_ids.push_back(ColText(st.Get(), 0));
  }
}

std::vector<model::DeleteOperationRecord> CollectOperations(sqlite3* db, Statement& st) {
  std::vector<model::DeleteOperationRecord> out;
  while (sqlite3_step(st.Get()) == SQLITE_ROW) {
    out.push_back(ReadOperation(st.Get()));
  }
  for (auto& r : out) {
    LoadFailures(db, r);
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Containers
// ------------------------------------------------------------------

Result SqliteRepository::InsertContainer(Transaction& t, const model::ContainerRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO containers(container_id,owner_id,name) VALUES(?,?,?);");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, r.container_id);
  BindText(st.Get(), 2, r.owner_id);
  BindText(st.Get(), 3, r.name);
  return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::ContainerRecord> SqliteRepository::GetContainer(Transaction& t, const std::string& container_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT container_id,owner_id,name FROM containers WHERE container_id=?;");
  st.RequirePrepared();
  BindText(st.Get(), 1, container_id);

  if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;

  model::ContainerRecord r;
  r.container_id = ColText(st.Get(), 0);
  r.owner_id     = ColText(st.Get(), 1);
  r.name         = ColText(st.Get(), 2);
  return r;
}

// ------------------------------------------------------------------
// Hierarchy
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("INSERT INTO entities(") + kEntityColumns + ") VALUES(?,?,?,?,?,?,?,?);");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, r.container_id);
  BindText(st.Get(), 2, r.entity_id);
  BindOptText(st.Get(), 3, r.parent_id);
  BindText(st.Get(), 4, r.name);
  BindI32(st.Get(), 5, r.is_deleted ? 1 : 0);
  BindOptU64(st.Get(), 6, r.deleted_at_ms);
  BindOptText(st.Get(), 7, r.deleted_by);
  BindOptU64(st.Get(), 8, r.expires_after_s);
  return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::EntityRecord> SqliteRepository::GetEntity(Transaction& t, const std::string& container_id, const std::string& entity_id) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kEntityColumns + " FROM entities WHERE container_id=? AND entity_id=?;");
  st.RequirePrepared();
  BindText(st.Get(), 1, container_id);
  BindText(st.Get(), 2, entity_id);

  if (sqlite3_step(st.Get()) != SQLITE_ROW) return std::nullopt;
  return ReadEntity(st.Get());
}

std::vector<model::EntityRecord> SqliteRepository::ListChildren(Transaction& t, const std::string& container_id, const std::string& parent_id,
                                                                const std::string& after_entity_id, uint32_t limit) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kEntityColumns +
                       " FROM entities WHERE container_id=? AND parent_id=? AND entity_id>? ORDER BY entity_id LIMIT ?;");
  st.RequirePrepared();
  BindText(st.Get(), 1, container_id);
  BindText(st.Get(), 2, parent_id);
  BindText(st.Get(), 3, after_entity_id);
  BindU64(st.Get(), 4, limit);

  std::vector<model::EntityRecord> out;
  while (sqlite3_step(st.Get()) == SQLITE_ROW) {
    out.push_back(ReadEntity(st.Get()));
  }
  return out;
}

bool SqliteRepository::HasLiveChildren(Transaction& t, const std::string& container_id, const std::string& entity_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT 1 FROM entities WHERE container_id=? AND parent_id=? AND is_deleted=0 LIMIT 1;");
  st.RequirePrepared();
  BindText(st.Get(), 1, container_id);
  BindText(st.Get(), 2, entity_id);
  return sqlite3_step(st.Get()) == SQLITE_ROW;
}

Result SqliteRepository::UpdateEntityDeletion(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE entities SET is_deleted=?,deleted_at_ms=?,deleted_by=?,expires_after_s=? WHERE container_id=? AND entity_id=?;");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());

  BindI32(st.Get(), 1, r.is_deleted ? 1 : 0);
  BindOptU64(st.Get(), 2, r.deleted_at_ms);
  BindOptText(st.Get(), 3, r.deleted_by);
  BindOptU64(st.Get(), 4, r.expires_after_s);
  BindText(st.Get(), 5, r.container_id);
  BindText(st.Get(), 6, r.entity_id);

  auto result = Translate(db, sqlite3_step(st.Get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "entity not found: " + r.entity_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Delete operation ledger
// ------------------------------------------------------------------

static Result WriteFailures(sqlite3* db, const model::DeleteOperationRecord& r) {
  {
    Statement del(db, "DELETE FROM delete_operation_failures WHERE container_id=? AND operation_id=?;");
    if (!del.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(del.Get(), 1, r.container_id);
    BindText(del.Get(), 2, r.operation_id);
    if (sqlite3_step(del.Get()) != SQLITE_DONE) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  for (const auto& entity_id : r.failed_entity_ids) {
    Statement ins(db, "INSERT OR IGNORE INTO delete_operation_failures(container_id,operation_id,entity_id) VALUES(?,?,?);");
    if (!ins.Prepared()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(ins.Get(), 1, r.container_id);
    BindText(ins.Get(), 2, r.operation_id);
    BindText(ins.Get(), 3, entity_id);
    if (sqlite3_step(ins.Get()) != SQLITE_DONE) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  return Result::Ok();
}

Result SqliteRepository::InsertOperation(Transaction& t, const model::DeleteOperationRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("INSERT INTO delete_operations(") + kOperationColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, r.container_id);
  BindText(st.Get(), 2, r.operation_id);
  BindText(st.Get(), 3, r.root_entity_id);
  BindText(st.Get(), 4, r.root_entity_name);
  BindI32(st.Get(), 5, static_cast<int>(r.status));
  BindI32(st.Get(), 6, r.cascade ? 1 : 0);
  BindU64(st.Get(), 7, r.total_entities);
  BindU64(st.Get(), 8, r.deleted_count);
  BindU64(st.Get(), 9, r.failed_count);
  BindOptText(st.Get(), 10, r.error_detail);
  BindText(st.Get(), 11, r.created_by);
  BindU64(st.Get(), 12, r.created_at_ms);
  BindOptU64(st.Get(), 13, r.started_at_ms);
  BindOptU64(st.Get(), 14, r.completed_at_ms);
  BindU64(st.Get(), 15, r.expires_at_ms);
  BindU64(st.Get(), 16, r.version);

  auto result = Translate(db, sqlite3_step(st.Get()));
  if (!result) return result;
  return WriteFailures(db, r);
}

std::optional<model::DeleteOperationRecord> SqliteRepository::GetOperation(Transaction& t, const std::string& container_id,
                                                                           const std::string& operation_id) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kOperationColumns + " FROM delete_operations WHERE container_id=? AND operation_id=?;");
  st.RequirePrepared();
  BindText(st.Get(), 1, container_id);
  BindText(st.Get(), 2, operation_id);

  auto rows = CollectOperations(db, st);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

Result SqliteRepository::UpdateOperation(Transaction& t, model::DeleteOperationRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE delete_operations SET status=?,total_entities=?,deleted_count=?,failed_count=?,error_detail=?,started_at_ms=?,"
               "completed_at_ms=?,expires_at_ms=?,version=? WHERE container_id=? AND operation_id=? AND version=?;");
  if (!st.Prepared()) return Translate(db, st.PrepareCode());

  BindI32(st.Get(), 1, static_cast<int>(r.status));
  BindU64(st.Get(), 2, r.total_entities);
  BindU64(st.Get(), 3, r.deleted_count);
  BindU64(st.Get(), 4, r.failed_count);
  BindOptText(st.Get(), 5, r.error_detail);
  BindOptU64(st.Get(), 6, r.started_at_ms);
  BindOptU64(st.Get(), 7, r.completed_at_ms);
  BindU64(st.Get(), 8, r.expires_at_ms);
  BindU64(st.Get(), 9, r.version + 1);
  BindText(st.Get(), 10, r.container_id);
  BindText(st.Get(), 11, r.operation_id);
  BindU64(st.Get(), 12, r.version);

  auto result = Translate(db, sqlite3_step(st.Get()));
  if (!result) return result;

  if (sqlite3_changes(db) == 0) {
    Statement existing(db, "SELECT 1 FROM delete_operations WHERE container_id=? AND operation_id=?;");
    existing.RequirePrepared();
    BindText(existing.Get(), 1, r.container_id);
    BindText(existing.Get(), 2, r.operation_id);
    if (sqlite3_step(existing.Get()) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "operation not found: " + r.operation_id);
    return Result::Err(ErrorCode::Conflict, "operation " + r.operation_id + " version " + std::to_string(r.version) + " is stale");
  }

  auto failures = WriteFailures(db, r);
  if (!failures) return failures;

  r.version += 1;
  return Result::Ok();
}

std::vector<model::DeleteOperationRecord> SqliteRepository::ListOperationsByStatus(Transaction& t, DeleteOperationStatus status, uint32_t limit) {
  auto* db = TX(t).Handle();

  const char* order = status == DELETE_OPERATION_STATUS_IN_PROGRESS ? " ORDER BY started_at_ms, created_at_ms" : " ORDER BY created_at_ms";
  Statement   st(db, std::string("SELECT ") + kOperationColumns + " FROM delete_operations WHERE status=?" + order + " LIMIT ?;");
  st.RequirePrepared();
  BindI32(st.Get(), 1, static_cast<int>(status));
  BindU64(st.Get(), 2, limit);

  return CollectOperations(db, st);
}

std::vector<model::DeleteOperationRecord> SqliteRepository::ListRecentOperations(Transaction& t, const std::string& container_id,
                                                                                 uint64_t created_after_ms, uint32_t limit) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kOperationColumns +
                       " FROM delete_operations WHERE container_id=? AND created_at_ms>=? ORDER BY created_at_ms DESC LIMIT ?;");
  st.RequirePrepared();
  BindText(st.Get(), 1, container_id);
  BindU64(st.Get(), 2, created_after_ms);
  BindU64(st.Get(), 3, limit);

  return CollectOperations(db, st);
}

// BEGIN IMMEDIATE already holds the database write lock.
void SqliteRepository::LockAdmission(Transaction&, const std::string&) {
}

uint64_t SqliteRepository::CountLiveOperations(Transaction& t, const std::string& container_id, const std::string& actor_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT COUNT(*) FROM delete_operations WHERE container_id=? AND created_by=? AND status IN (?,?);");
  st.RequirePrepared();
  BindText(st.Get(), 1, container_id);
  BindText(st.Get(), 2, actor_id);
  BindI32(st.Get(), 3, static_cast<int>(DELETE_OPERATION_STATUS_PENDING));
  BindI32(st.Get(), 4, static_cast<int>(DELETE_OPERATION_STATUS_IN_PROGRESS));

  if (sqlite3_step(st.Get()) != SQLITE_ROW) throw std::runtime_error(std::string("sqlite count: ") + sqlite3_errmsg(db));
  return ColU64(st.Get(), 0);
}

std::optional<model::DeleteOperationRecord> SqliteRepository::FindLiveOperationByRoot(Transaction& t, const std::string& container_id,
                                                                                      const std::string& root_entity_id) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kOperationColumns +
                       " FROM delete_operations WHERE container_id=? AND root_entity_id=? AND status IN (?,?) ORDER BY created_at_ms LIMIT 1;");
  st.RequirePrepared();
  BindText(st.Get(), 1, container_id);
  BindText(st.Get(), 2, root_entity_id);
  BindI32(st.Get(), 3, static_cast<int>(DELETE_OPERATION_STATUS_PENDING));
  BindI32(st.Get(), 4, static_cast<int>(DELETE_OPERATION_STATUS_IN_PROGRESS));

  auto rows = CollectOperations(db, st);
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

uint64_t SqliteRepository::DeleteExpiredOperations(Transaction& t, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM delete_operations WHERE status IN (?,?,?) AND expires_at_ms<=?;");
  st.RequirePrepared();
  BindI32(st.Get(), 1, static_cast<int>(DELETE_OPERATION_STATUS_COMPLETED));
  BindI32(st.Get(), 2, static_cast<int>(DELETE_OPERATION_STATUS_PARTIAL));
  BindI32(st.Get(), 3, static_cast<int>(DELETE_OPERATION_STATUS_FAILED));
  BindU64(st.Get(), 4, now_ms);

  if (sqlite3_step(st.Get()) != SQLITE_DONE) throw std::runtime_error(std::string("sqlite prune: ") + sqlite3_errmsg(db));
  return static_cast<uint64_t>(sqlite3_changes(db));
}

} // namespace cascade::db::sqlite
