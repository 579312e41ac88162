#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "cascade_options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/operation_ledger.hpp"

namespace cascade::core {

/*
  Read side of the ledger. Authorization is the caller's concern.
*/
class StatusReader {
 public:
  StatusReader(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::OperationLedger> ledger, const CascadeOptions& options);

  // Throws util::NotFound when unknown, in another container, or expired.
  db::model::DeleteOperationRecord GetById(const std::string& container_id, const std::string& operation_id) const;

  // Newest first within the retention window. limit 0 means the default.
  std::vector<db::model::DeleteOperationRecord> ListRecent(const std::string& container_id, uint32_t limit = 0) const;

  uint32_t ClampLimit(uint32_t requested) const;

 private:
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<ledger::OperationLedger> ledger_;
  uint32_t                                 default_limit_;
  uint32_t                                 max_limit_;
};

} // namespace cascade::core
