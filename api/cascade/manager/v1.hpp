#pragma once

#include "cascade/manager/core/v1/operation.pb.h"

#include "cascade/manager/services/v1/delete_operation_service.pb.h"
#include "cascade/manager/services/v1/delete_operation_service.grpc.pb.h"

namespace cascade::manager::v1 {
using namespace ::cascade::manager::core::v1;
using namespace ::cascade::manager::services::v1;
}
