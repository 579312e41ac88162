#include "status_reader.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace cascade::core {

StatusReader::StatusReader(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::OperationLedger> ledger,
                           const CascadeOptions& options)
    : repository_(std::move(repository)),
      ledger_(std::move(ledger)),
      default_limit_(options.default_list_limit),
      max_limit_(std::max<uint32_t>(options.max_list_limit, 1)) {
}

uint32_t StatusReader::ClampLimit(uint32_t requested) const {
  const auto limit = requested == 0 ? default_limit_ : requested;
  return std::clamp<uint32_t>(limit, 1, max_limit_);
}

db::model::DeleteOperationRecord StatusReader::GetById(const std::string& container_id, const std::string& operation_id) const {
  auto tx     = repository_->Begin();
  auto record = ledger_->Find(*tx, container_id, operation_id);
  tx->Commit();

  if (!record) {
    throw util::NotFound("Delete operation '" + operation_id + "' not found or has expired.");
  }
  return *record;
}

std::vector<db::model::DeleteOperationRecord> StatusReader::ListRecent(const std::string& container_id, uint32_t limit) const {
  auto tx      = repository_->Begin();
  auto records = ledger_->ListRecent(*tx, container_id, ClampLimit(limit));
  tx->Commit();
  return records;
}

} // namespace cascade::core
