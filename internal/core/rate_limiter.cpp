#include "rate_limiter.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cascade::core {

RateLimiter::RateLimiter(std::shared_ptr<ledger::OperationLedger> ledger, uint32_t max_concurrent, std::chrono::seconds retry_after)
    : ledger_(std::move(ledger)), max_concurrent_(max_concurrent), retry_after_(retry_after) {
}

uint64_t RateLimiter::CountActive(db::Transaction& tx, const std::string& container_id, const std::string& actor_id) const {
  return ledger_->CountLive(tx, container_id, actor_id);
}

void RateLimiter::Check(db::Transaction& tx, const std::string& container_id, const std::string& actor_id) const {
  const auto active = CountActive(tx, container_id, actor_id);
  if (active < max_concurrent_) {
    return;
  }

  CASCADE_LOG_WARN("Delete rate limit reached",
                   {observability::StringField("container_id", container_id), observability::StringField("actor_id", actor_id),
                    observability::IntField("active", static_cast<std::int64_t>(active)),
                    observability::IntField("max", static_cast<std::int64_t>(max_concurrent_))});
  throw util::RateLimited(active, max_concurrent_, static_cast<uint64_t>(retry_after_.count()));
}

} // namespace cascade::core
