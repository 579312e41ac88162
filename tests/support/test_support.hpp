#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/core/access_policy.hpp"
#include "internal/core/cascade_options.hpp"
#include "internal/core/cascade_processor.hpp"
#include "internal/core/delete_initiator.hpp"
#include "internal/core/rate_limiter.hpp"
#include "internal/core/status_reader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/operation_ledger.hpp"

namespace cascade::testing {

/*
  Repository decorator used to inject storage faults.

  - FailEntity: UpdateEntityDeletion for that entity returns IOError.
  - InjectOperationUpdateFault: after `skip` successful UpdateOperation
    calls, the next `count` calls return `code` without touching storage.
*/
class FaultInjectingRepository final : public db::Repository {
 public:
  explicit FaultInjectingRepository(std::shared_ptr<db::Repository> inner);

  void FailEntity(const std::string& entity_id);
  void InjectOperationUpdateFault(uint64_t skip, uint64_t count, db::ErrorCode code);
  void ClearFaults();

  uint64_t OperationUpdates() const {
    return operation_updates_.load();
  }

  std::unique_ptr<db::Transaction> Begin() override;

  db::Result InsertContainer(db::Transaction&, const db::model::ContainerRecord&) override;
  std::optional<db::model::ContainerRecord> GetContainer(db::Transaction&, const std::string&) override;

  db::Result InsertEntity(db::Transaction&, const db::model::EntityRecord&) override;
  std::optional<db::model::EntityRecord> GetEntity(db::Transaction&, const std::string& container_id, const std::string& entity_id) override;
  std::vector<db::model::EntityRecord> ListChildren(db::Transaction&, const std::string& container_id, const std::string& parent_id,
                                                    const std::string& after_entity_id, uint32_t limit) override;
  bool HasLiveChildren(db::Transaction&, const std::string& container_id, const std::string& entity_id) override;
  db::Result UpdateEntityDeletion(db::Transaction&, const db::model::EntityRecord&) override;

  db::Result InsertOperation(db::Transaction&, const db::model::DeleteOperationRecord&) override;
  std::optional<db::model::DeleteOperationRecord> GetOperation(db::Transaction&, const std::string& container_id,
                                                               const std::string& operation_id) override;
  db::Result UpdateOperation(db::Transaction&, db::model::DeleteOperationRecord&) override;
  std::vector<db::model::DeleteOperationRecord> ListOperationsByStatus(db::Transaction&, cascade::manager::core::v1::DeleteOperationStatus,
                                                                       uint32_t limit) override;
  std::vector<db::model::DeleteOperationRecord> ListRecentOperations(db::Transaction&, const std::string& container_id,
                                                                     uint64_t created_after_ms, uint32_t limit) override;
  void     LockAdmission(db::Transaction&, const std::string& container_id) override;
  uint64_t CountLiveOperations(db::Transaction&, const std::string& container_id, const std::string& actor_id) override;
  std::optional<db::model::DeleteOperationRecord> FindLiveOperationByRoot(db::Transaction&, const std::string& container_id,
                                                                          const std::string& root_entity_id) override;
  uint64_t DeleteExpiredOperations(db::Transaction&, uint64_t now_ms) override;

 private:
  std::shared_ptr<db::Repository> inner_;

  mutable std::mutex    mutex_;
  std::set<std::string> failing_entities_;
  uint64_t              fault_skip_  = 0;
  uint64_t              fault_count_ = 0;
  db::ErrorCode         fault_code_  = db::ErrorCode::OK;

  std::atomic<uint64_t> operation_updates_{0};
};

// Fully wired core over a fault-injecting repository.
struct Engine {
  core::CascadeOptions                      options;
  std::shared_ptr<FaultInjectingRepository> repository;
  std::shared_ptr<ledger::OperationLedger>  ledger;
  std::shared_ptr<core::AccessGuard>        access;
  std::shared_ptr<core::RateLimiter>        limiter;
  std::shared_ptr<core::DeleteInitiator>    initiator;
  std::shared_ptr<core::CascadeProcessor>   processor;
  std::shared_ptr<core::StatusReader>       reader;
};

// backing defaults to a fresh in-memory repository.
Engine MakeEngine(core::CascadeOptions options = {}, std::shared_ptr<db::Repository> backing = nullptr);

void SeedContainer(db::Repository& repo, const std::string& container_id, const std::string& owner_id);

void SeedEntity(db::Repository& repo, const std::string& container_id, const std::string& entity_id,
                const std::optional<std::string>& parent_id, bool deleted = false);

// Root plus `fanout` children per node for `depth` levels below it.
// Returns every seeded id, root first, in breadth-first order.
std::vector<std::string> SeedTree(db::Repository& repo, const std::string& container_id, const std::string& root_id, uint32_t fanout,
                                  uint32_t depth);

db::model::EntityRecord LoadEntity(db::Repository& repo, const std::string& container_id, const std::string& entity_id);

db::model::DeleteOperationRecord LoadOperation(db::Repository& repo, const std::string& container_id, const std::string& operation_id);

} // namespace cascade::testing
