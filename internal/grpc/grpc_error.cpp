#include "grpc_error.hpp"

#include <string>

namespace cascade::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace cascade::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const HasChildren*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const RateLimited*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

::grpc::Status ToStatus(const std::exception& e, ::grpc::ServerContext* ctx) {
  if (const auto* limited = dynamic_cast<const cascade::util::RateLimited*>(&e); limited && ctx) {
    ctx->AddTrailingMetadata("retry-after", std::to_string(limited->RetryAfterSeconds()));
  }
  return ToStatus(e);
}

} // namespace cascade::grpc
