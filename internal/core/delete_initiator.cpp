#include "delete_initiator.hpp"

#include "internal/core/operation_lifecycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace cascade::core {

using namespace cascade::manager::core::v1;

DeleteInitiator::DeleteInitiator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::OperationLedger> ledger,
                                 std::shared_ptr<AccessGuard> access, std::shared_ptr<RateLimiter> limiter)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), access_(std::move(access)), limiter_(std::move(limiter)) {
}

db::model::DeleteOperationRecord DeleteInitiator::Initiate(const std::string& container_id, const std::string& entity_id,
                                                           const std::string& actor_id, bool cascade) {
  auto tx = repository_->Begin();

  access_->Authorize(*tx, container_id, actor_id);
  repository_->LockAdmission(*tx, container_id);

  auto entity = repository_->GetEntity(*tx, container_id, entity_id);
  if (!entity) {
    throw util::NotFound("Entity '" + entity_id + "' not found in container '" + container_id + "'.");
  }

  if (auto live = ledger_->FindLiveForRoot(*tx, container_id, entity_id)) {
    throw util::AlreadyExists("Entity '" + entity_id + "' is already being deleted by operation '" + live->operation_id + "'.");
  }

  limiter_->Check(*tx, container_id, actor_id);

  if (!cascade && repository_->HasLiveChildren(*tx, container_id, entity_id)) {
    throw util::HasChildren("Cannot delete entity '" + entity->name + "' (ID: '" + entity_id +
                            "') without cascade: it has child entities. Use cascade=true to delete all descendants.");
  }

  db::model::DeleteOperationRecord record;
  record.operation_id     = util::GenerateOperationId();
  record.container_id     = container_id;
  record.root_entity_id   = entity_id;
  record.root_entity_name = entity->name;
  record.status           = DELETE_OPERATION_STATUS_PENDING;
  record.cascade          = cascade;
  record.created_by       = actor_id;
  record.created_at_ms    = util::NowMillis();

  ledger_->Create(*tx, record);
  tx->Commit();

  CASCADE_LOG_INFO("Delete operation created",
                   {observability::StringField("operation_id", record.operation_id), observability::StringField("container_id", container_id),
                    observability::StringField("entity_id", entity_id), observability::StringField("actor_id", actor_id),
                    observability::BoolField("cascade", cascade)});
  return record;
}

db::model::DeleteOperationRecord DeleteInitiator::Retry(const std::string& container_id, const std::string& operation_id,
                                                        const std::string& actor_id) {
  auto tx = repository_->Begin();

  access_->Authorize(*tx, container_id, actor_id);
  repository_->LockAdmission(*tx, container_id);

  auto record = ledger_->Find(*tx, container_id, operation_id);
  if (!record) {
    throw util::NotFound("Delete operation '" + operation_id + "' not found or has expired.");
  }

  lifecycle::ResetForRetry(*record);

  if (auto live = ledger_->FindLiveForRoot(*tx, container_id, record->root_entity_id); live && live->operation_id != operation_id) {
    throw util::AlreadyExists("Entity '" + record->root_entity_id + "' is already being deleted by operation '" + live->operation_id + "'.");
  }

  limiter_->Check(*tx, container_id, record->created_by);

  if (!ledger_->TryUpdate(*tx, *record)) {
    throw util::Conflict("Delete operation '" + operation_id + "' was modified concurrently; retry the request.");
  }
  tx->Commit();

  CASCADE_LOG_INFO("Delete operation re-queued",
                   {observability::StringField("operation_id", operation_id), observability::StringField("container_id", container_id),
                    observability::StringField("actor_id", actor_id)});
  return *record;
}

} // namespace cascade::core
