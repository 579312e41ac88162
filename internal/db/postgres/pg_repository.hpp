#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace cascade::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace cascade::db::postgres
