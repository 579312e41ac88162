#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/ledger/operation_ledger.hpp"

namespace cascade::core {

/*
  Per-actor ceiling on live (Pending or InProgress) delete operations
  within one container. Reads happen inside the caller's transaction so
  the count and the subsequent insert are atomic.
*/
class RateLimiter {
 public:
  RateLimiter(std::shared_ptr<ledger::OperationLedger> ledger, uint32_t max_concurrent, std::chrono::seconds retry_after);

  uint64_t CountActive(db::Transaction& tx, const std::string& container_id, const std::string& actor_id) const;

  // Throws util::RateLimited at or above the ceiling.
  void Check(db::Transaction& tx, const std::string& container_id, const std::string& actor_id) const;

 private:
  std::shared_ptr<ledger::OperationLedger> ledger_;
  uint32_t                                 max_concurrent_;
  std::chrono::seconds                     retry_after_;
};

} // namespace cascade::core
