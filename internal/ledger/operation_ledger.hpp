#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace cascade::ledger {

/*
  Delete operation ledger.

  Thin policy layer over db::Repository:
  - every write stamps expires_at_ms = now + retention
  - terminal records past their deadline are invisible to reads
  - conditional updates report a lost race as false instead of throwing

  All calls run inside a caller-owned transaction.
*/
class OperationLedger {
 public:
  OperationLedger(std::shared_ptr<db::Repository> repository, std::chrono::seconds retention);

  void Create(db::Transaction& tx, db::model::DeleteOperationRecord& record) const;

  std::optional<db::model::DeleteOperationRecord> Find(db::Transaction& tx, const std::string& container_id,
                                                       const std::string& operation_id) const;

  // false when another writer advanced the record first (or it is gone).
  [[nodiscard]] bool TryUpdate(db::Transaction& tx, db::model::DeleteOperationRecord& record) const;

  uint64_t CountLive(db::Transaction& tx, const std::string& container_id, const std::string& actor_id) const;

  std::optional<db::model::DeleteOperationRecord> FindLiveForRoot(db::Transaction& tx, const std::string& container_id,
                                                                  const std::string& root_entity_id) const;

  std::vector<db::model::DeleteOperationRecord> ListRecent(db::Transaction& tx, const std::string& container_id, uint32_t limit) const;

  std::vector<db::model::DeleteOperationRecord> ListByStatus(db::Transaction& tx, cascade::manager::core::v1::DeleteOperationStatus status,
                                                             uint32_t limit) const;

  uint64_t PruneExpired(db::Transaction& tx) const;

  std::chrono::seconds Retention() const {
    return retention_;
  }

 private:
  bool IsExpired(const db::model::DeleteOperationRecord& record, uint64_t now_ms) const;

  std::shared_ptr<db::Repository> repository_;
  std::chrono::seconds            retention_;
};

} // namespace cascade::ledger
