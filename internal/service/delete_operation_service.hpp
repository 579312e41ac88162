#pragma once

#include "cascade/manager/services/v1/delete_operation_service.pb.h"
#include "cascade/manager/v1.hpp"
#include "internal/db/model/delete_operation_record.hpp"
#include "service_context.hpp"

namespace cascade::service {

class DeleteOperationService {
 public:
  explicit DeleteOperationService(ServiceContext ctx);

  cascade::manager::v1::InitiateDeleteResponse InitiateDelete(const cascade::manager::v1::InitiateDeleteRequest& req);

  cascade::manager::v1::GetDeleteOperationResponse GetOperation(const cascade::manager::v1::GetDeleteOperationRequest& req);

  cascade::manager::v1::ListDeleteOperationsResponse ListOperations(const cascade::manager::v1::ListDeleteOperationsRequest& req);

  cascade::manager::v1::RetryDeleteOperationResponse RetryOperation(const cascade::manager::v1::RetryDeleteOperationRequest& req);

 private:
  void Authorize(const std::string& container_id, const std::string& actor_id);

  ServiceContext ctx_;
};

cascade::manager::v1::DeleteOperation ToProto(const cascade::db::model::DeleteOperationRecord& record);

std::string OperationLocation(const std::string& container_id, const std::string& operation_id);

} // namespace cascade::service
