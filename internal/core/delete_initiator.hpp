#pragma once

#include <memory>
#include <string>

#include "access_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/operation_ledger.hpp"
#include "rate_limiter.hpp"

namespace cascade::core {

/*
  Accepts delete requests and records them as Pending operations.

  Every check and the insert share one repository transaction, so two
  concurrent requests by the same actor cannot both pass the rate limit.
  Processing happens later on the cascade worker.
*/
class DeleteInitiator {
 public:
  DeleteInitiator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::OperationLedger> ledger,
                  std::shared_ptr<AccessGuard> access, std::shared_ptr<RateLimiter> limiter);

  db::model::DeleteOperationRecord Initiate(const std::string& container_id, const std::string& entity_id, const std::string& actor_id,
                                            bool cascade = true);

  // Re-queues a Partial or Failed operation.
  db::model::DeleteOperationRecord Retry(const std::string& container_id, const std::string& operation_id, const std::string& actor_id);

 private:
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<ledger::OperationLedger> ledger_;
  std::shared_ptr<AccessGuard>             access_;
  std::shared_ptr<RateLimiter>             limiter_;
};

} // namespace cascade::core
