#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/core/access_policy.hpp"
#include "internal/core/cascade_processor.hpp"
#include "internal/core/delete_initiator.hpp"
#include "internal/core/rate_limiter.hpp"
#include "internal/core/status_reader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/delete_operation_server.hpp"
#include "internal/ledger/operation_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/delete_operation_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/worker/cascade_worker.hpp"
#if CASCADE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CASCADE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace cascade::factory {

namespace {

std::shared_ptr<core::AccessPolicy> BuildAccessPolicy(const cascade::runtime::config::RuntimeConfig& config) {
  if (config.authorization().mode() == cascade::runtime::config::AUTHORIZATION_MODE_ALLOW_ALL) {
    CASCADE_LOG_WARN("Authorization disabled: every actor may delete in every container");
    return std::make_shared<core::AllowAllAccessPolicy>();
  }
  return std::make_shared<core::OwnerAccessPolicy>();
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const cascade::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CASCADE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->Bootstrap();
    CASCADE_LOG_INFO("Using sqlite backend", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CASCADE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Bootstrap();
    CASCADE_LOG_INFO("Using postgres backend");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CASCADE_LOG_WARN("Using in-memory backend; delete operations do not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const cascade::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto options = cascade::config::BuildCascadeOptions(config);

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto repository       = BuildRepository(config);
  auto operation_ledger = std::make_shared<ledger::OperationLedger>(repository, options.operation_retention);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto access    = std::make_shared<core::AccessGuard>(repository, BuildAccessPolicy(config));
  auto limiter   = std::make_shared<core::RateLimiter>(operation_ledger, options.max_concurrent_per_actor, options.retry_after);
  auto initiator = std::make_shared<core::DeleteInitiator>(repository, operation_ledger, access, limiter);
  auto reader    = std::make_shared<core::StatusReader>(repository, operation_ledger, options);
  auto processor = std::make_shared<core::CascadeProcessor>(repository, operation_ledger, options);

  // ------------------------------------------------------------------
  // Cascade worker
  // ------------------------------------------------------------------
  app.worker = std::make_shared<worker::CascadeWorker>(processor);
  app.worker->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.access     = access;
  ctx.initiator  = initiator;
  ctx.reader     = reader;

  auto delete_service = std::make_shared<service::DeleteOperationService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DeleteOperationServer>(delete_service));
  app.repository = repository;

  return app;
}

} // namespace cascade::factory
