#include "delete_operation_server.hpp"

#include "grpc_error.hpp"

namespace cascade::grpc {

DeleteOperationServer::DeleteOperationServer(std::shared_ptr<cascade::service::DeleteOperationService> svc) : service_(std::move(svc)) {
}

::grpc::Status DeleteOperationServer::InitiateDelete(::grpc::ServerContext* ctx, const cascade::manager::v1::InitiateDeleteRequest* req,
                                                     cascade::manager::v1::InitiateDeleteResponse* resp) {
  try {
    *resp = service_->InitiateDelete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status DeleteOperationServer::GetDeleteOperation(::grpc::ServerContext* ctx, const cascade::manager::v1::GetDeleteOperationRequest* req,
                                                         cascade::manager::v1::GetDeleteOperationResponse* resp) {
  try {
    *resp = service_->GetOperation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status DeleteOperationServer::ListDeleteOperations(::grpc::ServerContext*                                  ctx,
                                                           const cascade::manager::v1::ListDeleteOperationsRequest* req,
                                                           cascade::manager::v1::ListDeleteOperationsResponse*      resp) {
  try {
    *resp = service_->ListOperations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status DeleteOperationServer::RetryDeleteOperation(::grpc::ServerContext*                                  ctx,
                                                           const cascade::manager::v1::RetryDeleteOperationRequest* req,
                                                           cascade::manager::v1::RetryDeleteOperationResponse*      resp) {
  try {
    *resp = service_->RetryOperation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

} // namespace cascade::grpc
