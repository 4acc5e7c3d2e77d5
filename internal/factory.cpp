#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/embedding/feature_hash_embedder.hpp"
#include "internal/grpc/resource_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/validation/validator.hpp"
#if SIROS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SIROS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace siros::factory {

std::shared_ptr<db::Repository> BuildRepository(const siros::runtime::config::RuntimeConfig& config) {
  const auto& database  = config.database();
  const auto  dimension = config::VectorDimension(config);

  if (database.has_sqlite()) {
#if SIROS_DB_SQLITE
    const auto path = database.sqlite().path().empty() ? std::string("siros.db") : database.sqlite().path();
    auto       pool = std::make_shared<db::sqlite::SqlitePool>(path);
    db::sqlite::BootstrapSchema(*pool, dimension);
    SIROS_LOG_INFO("store opened", {observability::StringField("backend", "sqlite"), observability::StringField("path", path),
                                    observability::IntField("dimension", dimension)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool), dimension);
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SIROS_DB_POSTGRES
    const auto& postgres        = database.postgres();
    const auto  max_connections = postgres.max_connections() == 0 ? 16u : postgres.max_connections();
    auto        pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    db::postgres::BootstrapSchema(*pool, dimension);
    SIROS_LOG_INFO("store opened", {observability::StringField("backend", "postgres"), observability::IntField("dimension", dimension)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), dimension);
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SIROS_LOG_INFO("store opened", {observability::StringField("backend", "memory"), observability::IntField("dimension", dimension)});
  return std::make_shared<db::memory::MemoryRepository>(dimension);
}

/*
    Build full application dependency graph
*/
Application Build(const siros::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  std::shared_ptr<embedding::EmbeddingProvider> embedder;
  if (config::EmbeddingEnabled(config)) {
    embedder = std::make_shared<embedding::FeatureHashEmbedder>(app.repository->VectorDimension());
  } else {
    SIROS_LOG_WARN("embedding disabled; new resources stay unvectorized");
  }

  validation::ValidationOptions validation_options;
  validation_options.allowed_providers.assign(config.validation().allowed_providers().begin(), config.validation().allowed_providers().end());

  core::ManagerOptions manager_options;
  manager_options.max_k = config::MaxK(config);

  app.manager = std::make_shared<core::ResourceManager>(app.repository, std::move(embedder), validation::Validator(std::move(validation_options)),
                                                        manager_options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager          = app.manager;
  app.resource_service = std::make_shared<service::ResourceService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ResourceServer>(app.resource_service));

  return app;
}

} // namespace siros::factory
