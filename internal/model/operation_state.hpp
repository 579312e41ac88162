#pragma once

#include <string_view>

#include "cascade/manager/core/v1/operation.pb.h"

namespace cascade::model {

using OperationStatus = cascade::manager::core::v1::DeleteOperationStatus;

constexpr bool IsTerminal(OperationStatus status) {
  return status == cascade::manager::core::v1::DELETE_OPERATION_STATUS_COMPLETED ||
         status == cascade::manager::core::v1::DELETE_OPERATION_STATUS_PARTIAL ||
         status == cascade::manager::core::v1::DELETE_OPERATION_STATUS_FAILED;
}

// Pending or InProgress: counts against the per-actor ceiling.
constexpr bool IsLive(OperationStatus status) {
  return status == cascade::manager::core::v1::DELETE_OPERATION_STATUS_PENDING ||
         status == cascade::manager::core::v1::DELETE_OPERATION_STATUS_IN_PROGRESS;
}

constexpr bool IsRetryable(OperationStatus status) {
  return status == cascade::manager::core::v1::DELETE_OPERATION_STATUS_PARTIAL ||
         status == cascade::manager::core::v1::DELETE_OPERATION_STATUS_FAILED;
}

constexpr bool CanTransition(OperationStatus from, OperationStatus to) {
  using namespace cascade::manager::core::v1;

  if (to == DELETE_OPERATION_STATUS_UNSPECIFIED) {
    return false;
  }
  switch (from) {
    case DELETE_OPERATION_STATUS_PENDING:
      return to != DELETE_OPERATION_STATUS_PENDING;
    case DELETE_OPERATION_STATUS_IN_PROGRESS:
      return IsTerminal(to);
    case DELETE_OPERATION_STATUS_PARTIAL:
    case DELETE_OPERATION_STATUS_FAILED:
      return to == DELETE_OPERATION_STATUS_PENDING;
    default:
      return false;
  }
}

constexpr std::string_view ToApiString(OperationStatus status) {
  using namespace cascade::manager::core::v1;

  switch (status) {
    case DELETE_OPERATION_STATUS_PENDING:
      return "pending";
    case DELETE_OPERATION_STATUS_IN_PROGRESS:
      return "in_progress";
    case DELETE_OPERATION_STATUS_COMPLETED:
      return "completed";
    case DELETE_OPERATION_STATUS_PARTIAL:
      return "partial";
    case DELETE_OPERATION_STATUS_FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

} // namespace cascade::model
