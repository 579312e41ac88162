#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "cascade/manager/services/v1/delete_operation_service.grpc.pb.h"
#include "cascade/manager/v1.hpp"
#include "internal/model/operation_state.hpp"

using namespace cascade::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  cascadectl <addr> delete <container_id> <entity_id> <actor_id> [--no-cascade]\n"
            << "  cascadectl <addr> status <container_id> <operation_id> <actor_id>\n"
            << "  cascadectl <addr> list <container_id> <actor_id> [limit]\n"
            << "  cascadectl <addr> retry <container_id> <operation_id> <actor_id>\n"
            << "  cascadectl <addr> watch <container_id> <operation_id> <actor_id> [interval_ms]\n";
}

static void PrintOperation(const DeleteOperation& op) {
  std::cout << "operation_id=" << op.operation_id() << " status=" << cascade::model::ToApiString(op.status())
            << " root=" << op.root_entity_id() << " (" << op.root_entity_name() << ")"
            << " cascade=" << (op.cascade() ? "true" : "false") << " total=" << op.total_entities() << " deleted=" << op.deleted_count()
            << " failed=" << op.failed_count() << "\n";
  for (const auto& entity_id : op.failed_entity_ids()) {
    std::cout << "  failed_entity=" << entity_id << "\n";
  }
  if (op.has_error_detail()) {
    std::cout << "  error=" << op.error_detail() << "\n";
  }
}

static int ReportError(const grpc::ClientContext& ctx, const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  if (status.error_code() == grpc::StatusCode::RESOURCE_EXHAUSTED) {
    const auto& trailers = ctx.GetServerTrailingMetadata();
    auto        it       = trailers.find("retry-after");
    if (it != trailers.end()) {
      std::cerr << "retry after " << std::string(it->second.data(), it->second.size()) << "s\n";
    }
  }
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = DeleteOperationService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    InitiateDeleteRequest req;
    req.set_container_id(argv[3]);
    req.set_entity_id(argv[4]);
    req.set_actor_id(argv[5]);
    if (argc >= 7 && std::string(argv[6]) == "--no-cascade") {
      req.set_cascade(false);
    }

    grpc::ClientContext    ctx;
    InitiateDeleteResponse resp;
    auto                   status = stub->InitiateDelete(&ctx, req, &resp);
    if (!status.ok()) {
      return ReportError(ctx, status);
    }

    std::cout << "location=" << resp.location() << "\n";
    PrintOperation(resp.operation());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    GetDeleteOperationRequest req;
    req.set_container_id(argv[3]);
    req.set_operation_id(argv[4]);
    req.set_actor_id(argv[5]);

    grpc::ClientContext        ctx;
    GetDeleteOperationResponse resp;
    auto                       status = stub->GetDeleteOperation(&ctx, req, &resp);
    if (!status.ok()) {
      return ReportError(ctx, status);
    }

    PrintOperation(resp.operation());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    ListDeleteOperationsRequest req;
    req.set_container_id(argv[3]);
    req.set_actor_id(argv[4]);
    if (argc >= 6) {
      req.set_limit(static_cast<uint32_t>(std::stoul(argv[5])));
    }

    grpc::ClientContext          ctx;
    ListDeleteOperationsResponse resp;
    auto                         status = stub->ListDeleteOperations(&ctx, req, &resp);
    if (!status.ok()) {
      return ReportError(ctx, status);
    }

    std::cout << "count=" << resp.count() << "\n";
    for (const auto& op : resp.operations()) {
      PrintOperation(op);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "retry") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    RetryDeleteOperationRequest req;
    req.set_container_id(argv[3]);
    req.set_operation_id(argv[4]);
    req.set_actor_id(argv[5]);

    grpc::ClientContext          ctx;
    RetryDeleteOperationResponse resp;
    auto                         status = stub->RetryDeleteOperation(&ctx, req, &resp);
    if (!status.ok()) {
      return ReportError(ctx, status);
    }

    std::cout << "location=" << resp.location() << "\n";
    PrintOperation(resp.operation());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    const auto interval = std::chrono::milliseconds(argc >= 7 ? std::stoul(argv[6]) : 500);

    GetDeleteOperationRequest req;
    req.set_container_id(argv[3]);
    req.set_operation_id(argv[4]);
    req.set_actor_id(argv[5]);

    while (true) {
      grpc::ClientContext        ctx;
      GetDeleteOperationResponse resp;
      auto                       status = stub->GetDeleteOperation(&ctx, req, &resp);
      if (!status.ok()) {
        return ReportError(ctx, status);
      }

      PrintOperation(resp.operation());
      if (cascade::model::IsTerminal(resp.operation().status())) {
        return resp.operation().status() == DELETE_OPERATION_STATUS_COMPLETED ? 0 : 3;
      }
      std::this_thread::sleep_for(interval);
    }
  }

  Usage();
  return 1;
}
