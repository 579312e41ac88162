#include "operation_lifecycle.hpp"

#include "internal/model/operation_state.hpp"
#include "internal/util/errors.hpp"

namespace cascade::core::lifecycle {

using namespace cascade::manager::core::v1;

namespace {

void RequireTransition(const Record& record, DeleteOperationStatus to) {
  if (!model::CanTransition(record.status, to)) {
    throw util::InvalidState("Delete operation '" + record.operation_id + "' cannot move from " +
                             std::string(model::ToApiString(record.status)) + " to " + std::string(model::ToApiString(to)) + ".");
  }
}

void KeepTotalConsistent(Record& record) {
  const auto processed = record.deleted_count + record.failed_count;
  if (processed > record.total_entities) {
    record.total_entities = processed;
  }
}

} // namespace

DeleteOperationStatus CompletionStatus(uint64_t total, uint64_t deleted, uint64_t failed) {
  if (total == 0 || (deleted == 0 && failed == 0)) {
    return DELETE_OPERATION_STATUS_COMPLETED;
  }
  if (failed == total) {
    return DELETE_OPERATION_STATUS_FAILED;
  }
  if (failed > 0) {
    return DELETE_OPERATION_STATUS_PARTIAL;
  }
  return DELETE_OPERATION_STATUS_COMPLETED;
}

void Start(Record& record, uint64_t total_entities, uint64_t now_ms) {
  RequireTransition(record, DELETE_OPERATION_STATUS_IN_PROGRESS);
  record.status         = DELETE_OPERATION_STATUS_IN_PROGRESS;
  record.total_entities = total_entities;
  record.started_at_ms  = now_ms;
  record.completed_at_ms.reset();
  KeepTotalConsistent(record);
}

void RecordDeleted(Record& record) {
  ++record.deleted_count;
  KeepTotalConsistent(record);
}

FailureLog::FailureLog(Record& record) : record_(record), ids_(record.failed_entity_ids.begin(), record.failed_entity_ids.end()) {
}

bool FailureLog::Contains(const std::string& entity_id) const {
  return ids_.count(entity_id) > 0;
}

bool FailureLog::Add(const std::string& entity_id) {
  if (!ids_.insert(entity_id).second) {
    return false;
  }
  record_.failed_entity_ids.push_back(entity_id);
  record_.failed_count = record_.failed_entity_ids.size();
  KeepTotalConsistent(record_);
  return true;
}

DeleteOperationStatus Finalize(Record& record, uint64_t now_ms) {
  const auto status = CompletionStatus(record.total_entities, record.deleted_count, record.failed_count);
  RequireTransition(record, status);
  record.status          = status;
  record.completed_at_ms = now_ms;
  return status;
}

void Fail(Record& record, const std::string& detail, uint64_t now_ms) {
  RequireTransition(record, DELETE_OPERATION_STATUS_FAILED);
  record.status          = DELETE_OPERATION_STATUS_FAILED;
  record.error_detail    = detail;
  record.completed_at_ms = now_ms;
}

void ResetForRetry(Record& record) {
  if (!model::IsRetryable(record.status)) {
    throw util::InvalidState("Delete operation '" + record.operation_id + "' is " + std::string(model::ToApiString(record.status)) +
                             "; only partial or failed operations can be retried.");
  }
  record.status         = DELETE_OPERATION_STATUS_PENDING;
  record.total_entities = 0;
  record.deleted_count  = 0;
  record.failed_count   = 0;
  record.failed_entity_ids.clear();
  record.error_detail.reset();
  record.started_at_ms.reset();
  record.completed_at_ms.reset();
}

} // namespace cascade::core::lifecycle
