#include "cascade_processor.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <optional>

#include "internal/core/operation_lifecycle.hpp"
#include "internal/model/operation_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace cascade::core {

using namespace cascade::manager::core::v1;
using observability::IntField;
using observability::StringField;

CascadeProcessor::CascadeProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::OperationLedger> ledger,
                                   CascadeOptions options)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), options_(options) {
  options_.batch_size          = std::max<uint32_t>(options_.batch_size, 1);
  options_.discovery_page_size = std::max<uint32_t>(options_.discovery_page_size, 1);
  options_.claim_batch_size    = std::max<uint32_t>(options_.claim_batch_size, 1);
}

// ------------------------------------------------------------------
// Entry points
// ------------------------------------------------------------------

std::size_t CascadeProcessor::ResumeInProgress() {
  std::vector<Record> operations;
  {
    auto tx    = repository_->Begin();
    operations = ledger_->ListByStatus(*tx, DELETE_OPERATION_STATUS_IN_PROGRESS, std::numeric_limits<uint32_t>::max());
    tx->Commit();
  }

  if (!operations.empty()) {
    CASCADE_LOG_INFO("Resuming interrupted delete operations", {IntField("count", static_cast<std::int64_t>(operations.size()))});
  }

  std::size_t finished = 0;
  for (auto& operation : operations) {
    if (Process(std::move(operation)) == ProcessOutcome::kFinished) {
      ++finished;
    }
  }
  return finished;
}

std::size_t CascadeProcessor::ProcessPending() {
  std::vector<Record> operations;
  {
    auto tx    = repository_->Begin();
    operations = ledger_->ListByStatus(*tx, DELETE_OPERATION_STATUS_PENDING, options_.claim_batch_size);
    tx->Commit();
  }

  std::size_t finished = 0;
  for (auto& operation : operations) {
    if (Process(std::move(operation)) == ProcessOutcome::kFinished) {
      ++finished;
    }
  }
  return finished;
}

ProcessOutcome CascadeProcessor::Process(Record record) {
  observability::SpanScope span("CascadeProcessor.Process");
  span.SetAttribute("operation.id", record.operation_id);
  span.SetAttribute("container.id", record.container_id);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if (record.status == DELETE_OPERATION_STATUS_PENDING) {
      if (!Claim(record)) {
        return ProcessOutcome::kSkipped;
      }
    } else if (record.status == DELETE_OPERATION_STATUS_IN_PROGRESS) {
      if (!Reclaim(record)) {
        return ProcessOutcome::kSkipped;
      }
    } else {
      return ProcessOutcome::kSkipped;
    }

    // No batch has been checkpointed yet, so the stored total is not
    // trustworthy (the previous owner may have died before discovery).
    if (record.total_entities == 0 && record.deleted_count == 0 && record.failed_count == 0) {
      const auto total = CountRemaining(record);
      span.SetAttribute("operation.total_entities", static_cast<std::int64_t>(total));
      if (total > 0) {
        auto tx               = repository_->Begin();
        record.total_entities = total;
        if (!ledger_->TryUpdate(*tx, record)) {
          CASCADE_LOG_WARN("Lost delete operation after discovery", {StringField("operation_id", record.operation_id)});
          return ProcessOutcome::kAbandoned;
        }
        tx->Commit();
      }
    }

    if (record.total_entities > 0 && !RunDeletion(record)) {
      return ProcessOutcome::kAbandoned;
    }
    return Complete(record, started_at);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    return HandleFatal(record, e);
  }
}

uint64_t CascadeProcessor::PruneExpired() {
  auto       tx      = repository_->Begin();
  const auto removed = ledger_->PruneExpired(*tx);
  tx->Commit();

  if (removed > 0) {
    CASCADE_LOG_INFO("Pruned expired delete operations", {IntField("count", static_cast<std::int64_t>(removed))});
  }
  return removed;
}

// ------------------------------------------------------------------
// Ownership
// ------------------------------------------------------------------

bool CascadeProcessor::Claim(Record& record) {
  auto tx = repository_->Begin();
  lifecycle::Start(record, 0, util::NowMillis());
  if (!ledger_->TryUpdate(*tx, record)) {
    CASCADE_LOG_DEBUG("Delete operation claimed elsewhere", {StringField("operation_id", record.operation_id)});
    return false;
  }
  tx->Commit();

  CASCADE_LOG_INFO("Delete operation started", {StringField("operation_id", record.operation_id),
                                                StringField("container_id", record.container_id),
                                                StringField("root_entity_id", record.root_entity_id)});
  return true;
}

bool CascadeProcessor::Reclaim(Record& record) {
  auto tx = repository_->Begin();
  if (!ledger_->TryUpdate(*tx, record)) {
    return false;
  }
  tx->Commit();

  CASCADE_LOG_INFO("Delete operation resumed",
                   {StringField("operation_id", record.operation_id), IntField("deleted", static_cast<std::int64_t>(record.deleted_count)),
                    IntField("failed", static_cast<std::int64_t>(record.failed_count))});
  return true;
}

// ------------------------------------------------------------------
// Traversal
// ------------------------------------------------------------------

std::vector<db::model::EntityRecord> CascadeProcessor::ListAllChildren(const std::string& container_id, const std::string& parent_id) {
  std::vector<db::model::EntityRecord> children;
  std::string                          after;
  while (true) {
    std::vector<db::model::EntityRecord> page;
    {
      auto tx = repository_->Begin();
      page    = repository_->ListChildren(*tx, container_id, parent_id, after, options_.discovery_page_size);
      tx->Commit();
    }

    const bool last_page = page.size() < options_.discovery_page_size;
    if (!page.empty()) {
      after = page.back().entity_id;
    }
    std::move(page.begin(), page.end(), std::back_inserter(children));
    if (last_page) {
      break;
    }
  }
  return children;
}

uint64_t CascadeProcessor::CountRemaining(const Record& record) {
  std::optional<db::model::EntityRecord> root;
  {
    auto tx = repository_->Begin();
    root    = repository_->GetEntity(*tx, record.container_id, record.root_entity_id);
    tx->Commit();
  }
  if (!root) {
    return 0;
  }

  uint64_t count = root->is_deleted ? 0 : 1;
  if (!record.cascade) {
    return count;
  }

  // Deleted entities are walked through: their descendants may still be live.
  std::vector<std::string> level{root->entity_id};
  while (!level.empty()) {
    std::vector<std::string> next;
    for (const auto& parent_id : level) {
      for (const auto& child : ListAllChildren(record.container_id, parent_id)) {
        if (child.entity_id == root->entity_id) {
          continue;
        }
        if (!child.is_deleted) {
          ++count;
        }
        next.push_back(child.entity_id);
      }
    }
    level = std::move(next);
  }
  return count;
}

/*
  Each entity has a single parent, so a walk down from the root can only
  come back to the root itself (when its own ancestors loop through its
  subtree). Skipping the root terminates parent cycles.
*/
bool CascadeProcessor::RunDeletion(Record& record) {
  lifecycle::FailureLog    failures(record);
  std::vector<std::string> level{record.root_entity_id};

  while (!level.empty()) {
    for (std::size_t offset = 0; offset < level.size(); offset += options_.batch_size) {
      const auto               end = std::min(level.size(), offset + options_.batch_size);
      std::vector<std::string> batch(level.begin() + static_cast<std::ptrdiff_t>(offset), level.begin() + static_cast<std::ptrdiff_t>(end));
      if (!ProcessBatch(record, batch, failures)) {
        return false;
      }
    }

    if (!record.cascade) {
      break;
    }

    std::vector<std::string> next;
    for (const auto& parent_id : level) {
      for (const auto& child : ListAllChildren(record.container_id, parent_id)) {
        if (child.entity_id != record.root_entity_id) {
          next.push_back(child.entity_id);
        }
      }
    }
    level = std::move(next);
  }
  return true;
}

bool CascadeProcessor::ProcessBatch(Record& record, const std::vector<std::string>& entity_ids, lifecycle::FailureLog& failures) {
  auto       tx     = repository_->Begin();
  const auto now_ms = util::NowMillis();

  uint64_t deleted = 0;
  uint64_t failed  = 0;
  uint64_t skipped = 0;

  for (const auto& entity_id : entity_ids) {
    if (failures.Contains(entity_id)) {
      ++skipped;
      continue;
    }

    try {
      auto entity = repository_->GetEntity(*tx, record.container_id, entity_id);
      if (!entity || entity->is_deleted) {
        ++skipped;
        continue;
      }

      entity->is_deleted      = true;
      entity->deleted_at_ms   = now_ms;
      entity->deleted_by      = record.created_by;
      entity->expires_after_s = static_cast<uint64_t>(options_.entity_retention.count());

      const auto result = repository_->UpdateEntityDeletion(*tx, *entity);
      if (!result) {
        CASCADE_LOG_WARN("Entity soft-delete failed", {StringField("operation_id", record.operation_id),
                                                       StringField("entity_id", entity_id), StringField("error", result.message)});
        failures.Add(entity_id);
        ++failed;
        continue;
      }
      lifecycle::RecordDeleted(record);
      ++deleted;
    } catch (const std::exception& e) {
      CASCADE_LOG_WARN("Entity soft-delete failed",
                       {StringField("operation_id", record.operation_id), StringField("entity_id", entity_id), StringField("error", e.what())});
      failures.Add(entity_id);
      ++failed;
    }
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordEntitiesProcessed("skipped", skipped);
  if (deleted == 0 && failed == 0) {
    return true;
  }

  if (!ledger_->TryUpdate(*tx, record)) {
    CASCADE_LOG_WARN("Lost delete operation at checkpoint, abandoning", {StringField("operation_id", record.operation_id)});
    return false;
  }
  tx->Commit();

  metrics.RecordEntitiesProcessed("deleted", deleted);
  metrics.RecordEntitiesProcessed("failed", failed);
  CASCADE_LOG_DEBUG("Delete operation checkpoint",
                    {StringField("operation_id", record.operation_id), IntField("deleted", static_cast<std::int64_t>(record.deleted_count)),
                     IntField("failed", static_cast<std::int64_t>(record.failed_count)),
                     IntField("total", static_cast<std::int64_t>(record.total_entities))});
  return true;
}

// ------------------------------------------------------------------
// Terminal transitions
// ------------------------------------------------------------------

ProcessOutcome CascadeProcessor::Complete(Record& record, std::chrono::steady_clock::time_point started_at) {
  auto       tx     = repository_->Begin();
  const auto status = lifecycle::Finalize(record, util::NowMillis());
  if (!ledger_->TryUpdate(*tx, record)) {
    CASCADE_LOG_WARN("Lost delete operation at finalize, abandoning", {StringField("operation_id", record.operation_id)});
    return ProcessOutcome::kAbandoned;
  }
  tx->Commit();

  const auto status_name = model::ToApiString(status);
  const auto duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();

  CASCADE_LOG_INFO("Delete operation finished",
                   {StringField("operation_id", record.operation_id), StringField("status", status_name),
                    IntField("total", static_cast<std::int64_t>(record.total_entities)),
                    IntField("deleted", static_cast<std::int64_t>(record.deleted_count)),
                    IntField("failed", static_cast<std::int64_t>(record.failed_count)), observability::DoubleField("duration_ms", duration_ms)});
  observability::Metrics::Instance().RecordOperationFinished(status_name);
  observability::Metrics::Instance().ObserveCascadeDurationMs(status_name, duration_ms);
  return ProcessOutcome::kFinished;
}

ProcessOutcome CascadeProcessor::HandleFatal(Record& record, const std::exception& error) {
  CASCADE_LOG_ERROR("Delete operation processing failed",
                    {StringField("operation_id", record.operation_id), StringField("error", error.what())});

  try {
    auto tx      = repository_->Begin();
    auto current = repository_->GetOperation(*tx, record.container_id, record.operation_id);
    if (!current || current->version != record.version || model::IsTerminal(current->status)) {
      CASCADE_LOG_WARN("Delete operation owned elsewhere, not marking failed", {StringField("operation_id", record.operation_id)});
      return ProcessOutcome::kAbandoned;
    }

    lifecycle::Fail(*current, error.what(), util::NowMillis());
    if (!ledger_->TryUpdate(*tx, *current)) {
      return ProcessOutcome::kAbandoned;
    }
    tx->Commit();
    record = *current;
  } catch (const std::exception& e) {
    CASCADE_LOG_ERROR("Could not record delete operation failure",
                      {StringField("operation_id", record.operation_id), StringField("error", e.what())});
    return ProcessOutcome::kAbandoned;
  }

  observability::Metrics::Instance().RecordOperationFinished(model::ToApiString(DELETE_OPERATION_STATUS_FAILED));
  return ProcessOutcome::kFinished;
}

} // namespace cascade::core
