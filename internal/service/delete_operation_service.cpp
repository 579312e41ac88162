#include "delete_operation_service.hpp"

#include <chrono>

#include "internal/core/access_policy.hpp"
#include "internal/core/delete_initiator.hpp"
#include "internal/core/status_reader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace cascade::service {

using namespace cascade::manager::v1;

namespace {

void RequireField(const std::string& value, const char* name) {
  if (value.empty()) {
    throw cascade::util::InvalidArgument(std::string(name) + " is required");
  }
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& container_id, Fn&& fn) {
  cascade::observability::SpanScope span(route);
  span.SetAttribute("container.id", container_id);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    cascade::observability::Metrics::Instance().RecordRequest(route, true);
    cascade::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CASCADE_LOG_ERROR("RPC failed", {cascade::observability::StringField("route", route), cascade::observability::StringField("error", ex.what()),
                                     cascade::observability::StringField("container_id", container_id)});
    cascade::observability::Metrics::Instance().RecordRequest(route, false);
    cascade::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

DeleteOperation ToProto(const cascade::db::model::DeleteOperationRecord& record) {
  DeleteOperation op;
  op.set_operation_id(record.operation_id);
  op.set_container_id(record.container_id);
  op.set_root_entity_id(record.root_entity_id);
  op.set_root_entity_name(record.root_entity_name);
  op.set_status(record.status);
  op.set_cascade(record.cascade);
  op.set_total_entities(record.total_entities);
  op.set_deleted_count(record.deleted_count);
  op.set_failed_count(record.failed_count);
  for (const auto& entity_id : record.failed_entity_ids) {
    op.add_failed_entity_ids(entity_id);
  }
  if (record.error_detail) {
    op.set_error_detail(*record.error_detail);
  }
  op.set_created_by(record.created_by);
  *op.mutable_created_at() = cascade::util::ToProto(cascade::util::FromUnixMillis(record.created_at_ms));
  if (record.started_at_ms) {
    *op.mutable_started_at() = cascade::util::ToProto(cascade::util::FromUnixMillis(*record.started_at_ms));
  }
  if (record.completed_at_ms) {
    *op.mutable_completed_at() = cascade::util::ToProto(cascade::util::FromUnixMillis(*record.completed_at_ms));
  }
  *op.mutable_expires_at() = cascade::util::ToProto(cascade::util::FromUnixMillis(record.expires_at_ms));
  return op;
}

std::string OperationLocation(const std::string& container_id, const std::string& operation_id) {
  return "/containers/" + container_id + "/delete-operations/" + operation_id;
}

DeleteOperationService::DeleteOperationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void DeleteOperationService::Authorize(const std::string& container_id, const std::string& actor_id) {
  auto tx = ctx_.repository->Begin();
  ctx_.access->Authorize(*tx, container_id, actor_id);
  tx->Commit();
}

InitiateDeleteResponse DeleteOperationService::InitiateDelete(const InitiateDeleteRequest& req) {
  return ObserveRpc("DeleteOperationService.InitiateDelete", req.container_id(), [&] {
    RequireField(req.container_id(), "container_id");
    RequireField(req.entity_id(), "entity_id");
    RequireField(req.actor_id(), "actor_id");

    const bool with_descendants = req.has_cascade() ? req.cascade() : true;
    const auto record           = ctx_.initiator->Initiate(req.container_id(), req.entity_id(), req.actor_id(), with_descendants);

    InitiateDeleteResponse resp;
    *resp.mutable_operation() = ToProto(record);
    resp.set_location(OperationLocation(record.container_id, record.operation_id));
    return resp;
  });
}

GetDeleteOperationResponse DeleteOperationService::GetOperation(const GetDeleteOperationRequest& req) {
  return ObserveRpc("DeleteOperationService.GetDeleteOperation", req.container_id(), [&] {
    RequireField(req.container_id(), "container_id");
    RequireField(req.operation_id(), "operation_id");
    RequireField(req.actor_id(), "actor_id");

    Authorize(req.container_id(), req.actor_id());

    GetDeleteOperationResponse resp;
    *resp.mutable_operation() = ToProto(ctx_.reader->GetById(req.container_id(), req.operation_id()));
    return resp;
  });
}

ListDeleteOperationsResponse DeleteOperationService::ListOperations(const ListDeleteOperationsRequest& req) {
  return ObserveRpc("DeleteOperationService.ListDeleteOperations", req.container_id(), [&] {
    RequireField(req.container_id(), "container_id");
    RequireField(req.actor_id(), "actor_id");

    Authorize(req.container_id(), req.actor_id());

    ListDeleteOperationsResponse resp;
    for (const auto& record : ctx_.reader->ListRecent(req.container_id(), req.limit())) {
      *resp.add_operations() = ToProto(record);
    }
    resp.set_count(static_cast<uint32_t>(resp.operations_size()));
    return resp;
  });
}

RetryDeleteOperationResponse DeleteOperationService::RetryOperation(const RetryDeleteOperationRequest& req) {
  return ObserveRpc("DeleteOperationService.RetryDeleteOperation", req.container_id(), [&] {
    RequireField(req.container_id(), "container_id");
    RequireField(req.operation_id(), "operation_id");
    RequireField(req.actor_id(), "actor_id");

    const auto record = ctx_.initiator->Retry(req.container_id(), req.operation_id(), req.actor_id());

    RetryDeleteOperationResponse resp;
    *resp.mutable_operation() = ToProto(record);
    resp.set_location(OperationLocation(record.container_id, record.operation_id));
    return resp;
  });
}

} // namespace cascade::service
