#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace cascade::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertContainer(Transaction&, const model::ContainerRecord&) override;
  std::optional<model::ContainerRecord> GetContainer(Transaction&, const std::string&) override;

  Result InsertEntity(Transaction&, const model::EntityRecord&) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& container_id, const std::string& entity_id) override;
  std::vector<model::EntityRecord> ListChildren(Transaction&, const std::string& container_id, const std::string& parent_id,
                                                const std::string& after_entity_id, uint32_t limit) override;
  bool HasLiveChildren(Transaction&, const std::string& container_id, const std::string& entity_id) override;
  Result UpdateEntityDeletion(Transaction&, const model::EntityRecord&) override;

  Result InsertOperation(Transaction&, const model::DeleteOperationRecord&) override;
  std::optional<model::DeleteOperationRecord> GetOperation(Transaction&, const std::string& container_id,
                                                           const std::string& operation_id) override;
  Result UpdateOperation(Transaction&, model::DeleteOperationRecord&) override;
  std::vector<model::DeleteOperationRecord> ListOperationsByStatus(Transaction&, cascade::manager::core::v1::DeleteOperationStatus,
                                                                   uint32_t limit) override;
  std::vector<model::DeleteOperationRecord> ListRecentOperations(Transaction&, const std::string& container_id, uint64_t created_after_ms,
                                                                 uint32_t limit) override;
  void LockAdmission(Transaction&, const std::string&) override;
  uint64_t CountLiveOperations(Transaction&, const std::string& container_id, const std::string& actor_id) override;
  std::optional<model::DeleteOperationRecord> FindLiveOperationByRoot(Transaction&, const std::string& container_id,
                                                                      const std::string& root_entity_id) override;
  uint64_t DeleteExpiredOperations(Transaction&, uint64_t now_ms) override;

private:
  friend class MemoryTransaction;

  using Key = std::pair<std::string, std::string>;

  struct State {
    std::unordered_map<std::string, model::ContainerRecord> containers;
    std::map<Key, model::EntityRecord> entities;
    // (container, parent) -> ordered child ids
    std::map<Key, std::set<std::string>> children;
    std::map<Key, model::DeleteOperationRecord> operations;
  };

  std::mutex mutex_;
  State committed_;
};

} // namespace cascade::db::memory
