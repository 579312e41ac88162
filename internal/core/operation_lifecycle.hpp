#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>

#include "internal/db/model/delete_operation_record.hpp"

namespace cascade::core::lifecycle {

/*
  State transitions and progress accounting for a delete operation record.

  These only mutate the in-memory record; persisting it is the caller's
  job (see ledger::OperationLedger::TryUpdate). Illegal transitions throw
  util::InvalidState.
*/

using Record = db::model::DeleteOperationRecord;

// Completion rule applied by Finalize.
cascade::manager::core::v1::DeleteOperationStatus CompletionStatus(uint64_t total, uint64_t deleted, uint64_t failed);

// Pending -> InProgress.
void Start(Record& record, uint64_t total_entities, uint64_t now_ms);

void RecordDeleted(Record& record);

// Failed entity ids of one record, indexed for the length of a run.
class FailureLog {
 public:
  explicit FailureLog(Record& record);

  bool Contains(const std::string& entity_id) const;

  // Appends to record.failed_entity_ids. Returns false if already there.
  bool Add(const std::string& entity_id);

 private:
  Record&                         record_;
  std::unordered_set<std::string> ids_;
};

cascade::manager::core::v1::DeleteOperationStatus Finalize(Record& record, uint64_t now_ms);

void Fail(Record& record, const std::string& detail, uint64_t now_ms);

// Partial|Failed -> Pending with progress cleared.
void ResetForRetry(Record& record);

} // namespace cascade::core::lifecycle
