#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cascade_options.hpp"
#include "internal/core/operation_lifecycle.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/operation_ledger.hpp"

namespace cascade::core {

enum class ProcessOutcome {
  kSkipped,   // not claimable: terminal, or another worker owns it
  kAbandoned, // lost ownership mid-run; left for the new owner
  kFinished,  // reached a terminal status
};

/*
  Drives delete operations to a terminal status.

  Flow per operation:
    claim (CAS Pending -> InProgress)
    discovery (BFS count of live entities in the subtree)
    deletion (BFS level by level, batch_size entities per transaction,
              checkpointing the counters in the same transaction)
    finalize (completion rule)

  Every ledger write is conditional on the record version. A worker whose
  write loses the race stops touching the operation. Any other error marks
  the operation Failed with error_detail set.

  Thread safety: one instance may be shared by several worker threads;
  all coordination happens through the repository.
*/
class CascadeProcessor {
 public:
  CascadeProcessor(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::OperationLedger> ledger, CascadeOptions options);

  // Takes over operations left InProgress by a previous process.
  std::size_t ResumeInProgress();

  // Processes up to claim_batch_size Pending operations, oldest first.
  std::size_t ProcessPending();

  ProcessOutcome Process(db::model::DeleteOperationRecord operation);

  uint64_t PruneExpired();

  const CascadeOptions& Options() const {
    return options_;
  }

 private:
  using Record = db::model::DeleteOperationRecord;

  bool Claim(Record& record);
  bool Reclaim(Record& record);

  uint64_t CountRemaining(const Record& record);

  bool RunDeletion(Record& record);
  bool ProcessBatch(Record& record, const std::vector<std::string>& entity_ids, lifecycle::FailureLog& failures);

  std::vector<db::model::EntityRecord> ListAllChildren(const std::string& container_id, const std::string& parent_id);

  ProcessOutcome Complete(Record& record, std::chrono::steady_clock::time_point started_at);
  ProcessOutcome HandleFatal(Record& record, const std::exception& error);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<ledger::OperationLedger> ledger_;
  CascadeOptions                           options_;
};

} // namespace cascade::core
