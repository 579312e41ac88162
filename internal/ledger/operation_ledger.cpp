#include "operation_ledger.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/model/operation_state.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cascade::ledger {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace

OperationLedger::OperationLedger(std::shared_ptr<db::Repository> repository, std::chrono::seconds retention)
    : repository_(std::move(repository)), retention_(retention) {
}

bool OperationLedger::IsExpired(const db::model::DeleteOperationRecord& record, uint64_t now_ms) const {
  return model::IsTerminal(record.status) && record.expires_at_ms <= now_ms;
}

void OperationLedger::Create(db::Transaction& tx, db::model::DeleteOperationRecord& record) const {
  const auto now_ms    = util::NowMillis();
  record.expires_at_ms = now_ms + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(retention_).count());
  record.version       = 0;
  ThrowIfDbError(repository_->InsertOperation(tx, record), "create delete operation " + record.operation_id);
}

std::optional<db::model::DeleteOperationRecord> OperationLedger::Find(db::Transaction& tx, const std::string& container_id,
                                                                      const std::string& operation_id) const {
  auto record = repository_->GetOperation(tx, container_id, operation_id);
  if (!record || IsExpired(*record, util::NowMillis())) {
    return std::nullopt;
  }
  return record;
}

bool OperationLedger::TryUpdate(db::Transaction& tx, db::model::DeleteOperationRecord& record) const {
  const auto previous_expiry = record.expires_at_ms;
  record.expires_at_ms =
      util::NowMillis() + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(retention_).count());

  const auto result = repository_->UpdateOperation(tx, record);
  if (result) {
    return true;
  }

  record.expires_at_ms = previous_expiry;
  if (result.code == db::ErrorCode::Conflict || result.code == db::ErrorCode::NotFound) {
    return false;
  }
  ThrowIfDbError(result, "update delete operation " + record.operation_id);
  return false;
}

uint64_t OperationLedger::CountLive(db::Transaction& tx, const std::string& container_id, const std::string& actor_id) const {
  return repository_->CountLiveOperations(tx, container_id, actor_id);
}

std::optional<db::model::DeleteOperationRecord> OperationLedger::FindLiveForRoot(db::Transaction& tx, const std::string& container_id,
                                                                                 const std::string& root_entity_id) const {
  return repository_->FindLiveOperationByRoot(tx, container_id, root_entity_id);
}

std::vector<db::model::DeleteOperationRecord> OperationLedger::ListRecent(db::Transaction& tx, const std::string& container_id,
                                                                          uint32_t limit) const {
  const auto now_ms    = util::NowMillis();
  const auto window_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(retention_).count());
  const auto since_ms  = now_ms > window_ms ? now_ms - window_ms : 0;

  auto records = repository_->ListRecentOperations(tx, container_id, since_ms, limit);
  records.erase(std::remove_if(records.begin(), records.end(),
                               [&](const db::model::DeleteOperationRecord& record) {
                                 return IsExpired(record, now_ms);
                               }),
                records.end());
  return records;
}

std::vector<db::model::DeleteOperationRecord> OperationLedger::ListByStatus(db::Transaction&                                  tx,
                                                                            cascade::manager::core::v1::DeleteOperationStatus status,
                                                                            uint32_t                                          limit) const {
  return repository_->ListOperationsByStatus(tx, status, limit);
}

uint64_t OperationLedger::PruneExpired(db::Transaction& tx) const {
  return repository_->DeleteExpiredOperations(tx, util::NowMillis());
}

} // namespace cascade::ledger
