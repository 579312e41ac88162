#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/container_record.hpp"
#include "internal/db/model/delete_operation_record.hpp"
#include "internal/db/model/entity_record.hpp"

namespace cascade::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateOperation is a compare-and-set on version
  - Claim exclusivity and resume correctness depend on this behavior

  The DB is the source of truth for:
    containers
    the entity hierarchy and its deletion fields
    the delete operation ledger
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Containers
  // ---------------------------------------------------------------------

  virtual Result InsertContainer(Transaction&, const model::ContainerRecord&) = 0;

  virtual std::optional<model::ContainerRecord> GetContainer(Transaction&, const std::string& container_id) = 0;

  // ---------------------------------------------------------------------
  // Hierarchy
  // ---------------------------------------------------------------------

  virtual Result InsertEntity(Transaction&, const model::EntityRecord&) = 0;

  // Returns soft-deleted entities too.
  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& container_id, const std::string& entity_id) = 0;

  // Direct children ordered by entity_id, starting strictly after
  // after_entity_id (empty = first page). Includes soft-deleted children.
  virtual std::vector<model::EntityRecord> ListChildren(Transaction&, const std::string& container_id, const std::string& parent_id,
                                                        const std::string& after_entity_id, uint32_t limit) = 0;

  virtual bool HasLiveChildren(Transaction&, const std::string& container_id, const std::string& entity_id) = 0;

  // Writes is_deleted and the deletion fields of an existing entity.
  virtual Result UpdateEntityDeletion(Transaction&, const model::EntityRecord&) = 0;

  // ---------------------------------------------------------------------
  // Delete operation ledger
  // ---------------------------------------------------------------------

  virtual Result InsertOperation(Transaction&, const model::DeleteOperationRecord&) = 0;

  virtual std::optional<model::DeleteOperationRecord> GetOperation(Transaction&, const std::string& container_id,
                                                                   const std::string& operation_id) = 0;

  // Succeeds only if the stored version equals record.version; stores the
  // row with version + 1 and advances record.version. Conflict otherwise.
  virtual Result UpdateOperation(Transaction&, model::DeleteOperationRecord& record) = 0;

  // All containers. Pending ordered by created_at, InProgress by started_at.
  virtual std::vector<model::DeleteOperationRecord> ListOperationsByStatus(Transaction&, cascade::manager::core::v1::DeleteOperationStatus status,
                                                                           uint32_t limit) = 0;

  // created_at_ms >= created_after_ms, newest first.
  virtual std::vector<model::DeleteOperationRecord> ListRecentOperations(Transaction&, const std::string& container_id,
                                                                         uint64_t created_after_ms, uint32_t limit) = 0;

  // Serializes admission in a container until the transaction ends.
  // Backends whose transactions already exclude each other may do nothing.
  virtual void LockAdmission(Transaction&, const std::string& container_id) = 0;

  // Pending or InProgress operations created by actor_id in the container.
  virtual uint64_t CountLiveOperations(Transaction&, const std::string& container_id, const std::string& actor_id) = 0;

  virtual std::optional<model::DeleteOperationRecord> FindLiveOperationByRoot(Transaction&, const std::string& container_id,
                                                                              const std::string& root_entity_id) = 0;

  // Removes terminal operations with expires_at_ms <= now_ms.
  virtual uint64_t DeleteExpiredOperations(Transaction&, uint64_t now_ms) = 0;
};

} // namespace cascade::db
