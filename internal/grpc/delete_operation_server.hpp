#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "cascade/manager/services/v1/delete_operation_service.grpc.pb.h"
#include "cascade/manager/v1.hpp"
#include "internal/service/delete_operation_service.hpp"

namespace cascade::grpc {

class DeleteOperationServer final : public cascade::manager::v1::DeleteOperationService::Service {
 public:
  explicit DeleteOperationServer(std::shared_ptr<cascade::service::DeleteOperationService> svc);

  ::grpc::Status InitiateDelete(::grpc::ServerContext*, const cascade::manager::v1::InitiateDeleteRequest*,
                                cascade::manager::v1::InitiateDeleteResponse*) override;

  ::grpc::Status GetDeleteOperation(::grpc::ServerContext*, const cascade::manager::v1::GetDeleteOperationRequest*,
                                    cascade::manager::v1::GetDeleteOperationResponse*) override;

  ::grpc::Status ListDeleteOperations(::grpc::ServerContext*, const cascade::manager::v1::ListDeleteOperationsRequest*,
                                      cascade::manager::v1::ListDeleteOperationsResponse*) override;

  ::grpc::Status RetryDeleteOperation(::grpc::ServerContext*, const cascade::manager::v1::RetryDeleteOperationRequest*,
                                      cascade::manager::v1::RetryDeleteOperationResponse*) override;

 private:
  std::shared_ptr<cascade::service::DeleteOperationService> service_;
};

} // namespace cascade::grpc
