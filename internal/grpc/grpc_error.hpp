#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace cascade::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// ToStatus plus the retry-after trailer for rate limit rejections.
::grpc::Status ToStatus(const std::exception& e, ::grpc::ServerContext* ctx);

} // namespace cascade::grpc
