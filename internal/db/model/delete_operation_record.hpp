#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cascade/manager/core/v1/operation.pb.h"

namespace cascade::db::model {

/*
  Persistent delete operation row (the ledger).

  IMPORTANT:
  - version is the optimistic concurrency token; every claim, checkpoint
    and finalize is a conditional write on it.
  - failed_entity_ids holds no duplicates; failed_count == its size.
  - expires_at_ms is refreshed on every write and only honored once the
    operation is terminal.
*/
struct DeleteOperationRecord {
  std::string operation_id;
  std::string container_id;
  std::string root_entity_id;
  std::string root_entity_name;

  cascade::manager::core::v1::DeleteOperationStatus status = cascade::manager::core::v1::DELETE_OPERATION_STATUS_UNSPECIFIED;

  bool cascade = true;

  uint64_t                   total_entities = 0;
  uint64_t                   deleted_count  = 0;
  uint64_t                   failed_count   = 0;
  std::vector<std::string>   failed_entity_ids;
  std::optional<std::string> error_detail;

  std::string             created_by;
  uint64_t                created_at_ms = 0;
  std::optional<uint64_t> started_at_ms;
  std::optional<uint64_t> completed_at_ms;

  uint64_t expires_at_ms = 0;
  uint64_t version       = 0;
};

} // namespace cascade::db::model
