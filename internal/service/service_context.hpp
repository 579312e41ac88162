#pragma once

#include <memory>

namespace cascade::core {
class AccessGuard;
class DeleteInitiator;
class StatusReader;
} // namespace cascade::core
namespace cascade::db {
class Repository;
}

namespace cascade::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<cascade::db::Repository>    repository;
  std::shared_ptr<cascade::core::AccessGuard> access;
  std::shared_ptr<cascade::core::DeleteInitiator> initiator;
  std::shared_ptr<cascade::core::StatusReader>    reader;
};

} // namespace cascade::service
