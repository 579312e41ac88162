#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace cascade::worker {
class CascadeWorker;
}

namespace cascade::factory {

/*
  Application

  Owns everything that lives for the lifetime of the process:
  the gRPC adapters handed to runtime::Server and the cascade worker pool.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<worker::CascadeWorker>        worker;
};

/*
  Build

  Constructs the entire backend based on runtime config and starts the
  cascade worker.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const cascade::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const cascade::runtime::config::RuntimeConfig& config);

} // namespace cascade::factory
