#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/operation_state.hpp"
#include "memory_tx.hpp"

namespace cascade::db::memory {

using cascade::manager::core::v1::DELETE_OPERATION_STATUS_IN_PROGRESS;
using cascade::manager::core::v1::DELETE_OPERATION_STATUS_PENDING;
using cascade::manager::core::v1::DeleteOperationStatus;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Containers
// ------------------------------------------------------------------

Result MemoryRepository::InsertContainer(Transaction& t, const model::ContainerRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.containers.contains(r.container_id)) return Result::Err(ErrorCode::AlreadyExists, "container exists: " + r.container_id);
  s.containers[r.container_id] = r;
  return Result::Ok();
}

std::optional<model::ContainerRecord> MemoryRepository::GetContainer(Transaction& t, const std::string& container_id) {
  const auto& s  = TX(t).View();
  auto        it = s.containers.find(container_id);
  if (it == s.containers.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Hierarchy
// ------------------------------------------------------------------

Result MemoryRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto& s   = TX(t).Mutable();
  Key   key = {r.container_id, r.entity_id};
  if (s.entities.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "entity exists: " + r.entity_id);
  s.entities[key] = r;
  if (r.parent_id) {
    s.children[{r.container_id, *r.parent_id}].insert(r.entity_id);
  }
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, const std::string& container_id, const std::string& entity_id) {
  const auto& s  = TX(t).View();
  auto        it = s.entities.find({container_id, entity_id});
  if (it == s.entities.end()) return std::nullopt;
  return it->second;
}

std::vector<model::EntityRecord> MemoryRepository::ListChildren(Transaction& t, const std::string& container_id, const std::string& parent_id,
                                                                const std::string& after_entity_id, uint32_t limit) {
  const auto&                      s = TX(t).View();
  std::vector<model::EntityRecord> out;

  auto children = s.children.find({container_id, parent_id});
  if (children == s.children.end()) return out;

  auto it = after_entity_id.empty() ? children->second.begin() : children->second.upper_bound(after_entity_id);
  for (; it != children->second.end() && out.size() < limit; ++it) {
    auto entity = s.entities.find({container_id, *it});
    if (entity != s.entities.end()) out.push_back(entity->second);
  }
  return out;
}

bool MemoryRepository::HasLiveChildren(Transaction& t, const std::string& container_id, const std::string& entity_id) {
  const auto& s        = TX(t).View();
  auto        children = s.children.find({container_id, entity_id});
  if (children == s.children.end()) return false;

  return std::any_of(children->second.begin(), children->second.end(), [&](const std::string& child_id) {
    auto entity = s.entities.find({container_id, child_id});
    return entity != s.entities.end() && !entity->second.is_deleted;
  });
}

Result MemoryRepository::UpdateEntityDeletion(Transaction& t, const model::EntityRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entities.find({r.container_id, r.entity_id});
  if (it == s.entities.end()) return Result::Err(ErrorCode::NotFound, "entity not found: " + r.entity_id);

  it->second.is_deleted      = r.is_deleted;
  it->second.deleted_at_ms   = r.deleted_at_ms;
  it->second.deleted_by      = r.deleted_by;
  it->second.expires_after_s = r.expires_after_s;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Delete operation ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertOperation(Transaction& t, const model::DeleteOperationRecord& r) {
  auto& s   = TX(t).Mutable();
  Key   key = {r.container_id, r.operation_id};
  if (s.operations.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "operation exists: " + r.operation_id);
  s.operations[key] = r;
  return Result::Ok();
}

std::optional<model::DeleteOperationRecord> MemoryRepository::GetOperation(Transaction& t, const std::string& container_id,
                                                                           const std::string& operation_id) {
  const auto& s  = TX(t).View();
  auto        it = s.operations.find({container_id, operation_id});
  if (it == s.operations.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateOperation(Transaction& t, model::DeleteOperationRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.operations.find({r.container_id, r.operation_id});
  if (it == s.operations.end()) return Result::Err(ErrorCode::NotFound, "operation not found: " + r.operation_id);
  if (it->second.version != r.version) {
    return Result::Err(ErrorCode::Conflict, "operation " + r.operation_id + " version " + std::to_string(r.version) + " is stale");
  }

  it->second         = r;
  it->second.version = r.version + 1;
  r.version          = it->second.version;
  return Result::Ok();
}

std::vector<model::DeleteOperationRecord> MemoryRepository::ListOperationsByStatus(Transaction& t, DeleteOperationStatus status, uint32_t limit) {
  const auto&                               s = TX(t).View();
  std::vector<model::DeleteOperationRecord> out;
  for (const auto& [_, op] : s.operations) {
    if (op.status == status) out.push_back(op);
  }

  if (status == DELETE_OPERATION_STATUS_IN_PROGRESS) {
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
      return a.started_at_ms.value_or(0) < b.started_at_ms.value_or(0);
    });
  } else {
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
      return a.created_at_ms < b.created_at_ms;
    });
  }

  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::DeleteOperationRecord> MemoryRepository::ListRecentOperations(Transaction& t, const std::string& container_id,
                                                                                 uint64_t created_after_ms, uint32_t limit) {
  const auto&                               s = TX(t).View();
  std::vector<model::DeleteOperationRecord> out;

  auto it = s.operations.lower_bound({container_id, std::string{}});
  for (; it != s.operations.end() && it->first.first == container_id; ++it) {
    if (it->second.created_at_ms >= created_after_ms) out.push_back(it->second);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms > b.created_at_ms;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

// The transaction holds the repository mutex.
void MemoryRepository::LockAdmission(Transaction&, const std::string&) {
}

uint64_t MemoryRepository::CountLiveOperations(Transaction& t, const std::string& container_id, const std::string& actor_id) {
  const auto& s     = TX(t).View();
  uint64_t    count = 0;

  auto it = s.operations.lower_bound({container_id, std::string{}});
  for (; it != s.operations.end() && it->first.first == container_id; ++it) {
    if (it->second.created_by == actor_id && cascade::model::IsLive(it->second.status)) ++count;
  }
  return count;
}

std::optional<model::DeleteOperationRecord> MemoryRepository::FindLiveOperationByRoot(Transaction& t, const std::string& container_id,
                                                                                      const std::string& root_entity_id) {
  const auto& s = TX(t).View();

  auto it = s.operations.lower_bound({container_id, std::string{}});
  for (; it != s.operations.end() && it->first.first == container_id; ++it) {
    if (it->second.root_entity_id == root_entity_id && cascade::model::IsLive(it->second.status)) return it->second;
  }
  return std::nullopt;
}

uint64_t MemoryRepository::DeleteExpiredOperations(Transaction& t, uint64_t now_ms) {
  auto&    s       = TX(t).Mutable();
  uint64_t removed = 0;
  for (auto it = s.operations.begin(); it != s.operations.end();) {
    if (cascade::model::IsTerminal(it->second.status) && it->second.expires_at_ms <= now_ms) {
      it = s.operations.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

} // namespace cascade::db::memory
