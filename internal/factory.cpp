#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/collaborators/bucket_resolver.hpp"
#include "internal/collaborators/category_directory.hpp"
#include "internal/collaborators/logging_sinks.hpp"
#include "internal/collaborators/metadata_writer.hpp"
#include "internal/collaborators/plan_limit_gate.hpp"
#include "internal/core/completion_pipeline.hpp"
#include "internal/core/session_initiator.hpp"
#include "internal/core/session_lifecycle.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/upload_server.hpp"
#include "internal/objectstore/memory/memory_object_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if UPLOAD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if UPLOAD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if UPLOAD_OBJECT_STORE_S3
#include "internal/objectstore/s3/s3_object_store.hpp"
#endif

namespace upload::factory {

using namespace upload;

namespace {

#if UPLOAD_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  if (sqlite_db->ApplySchema(db::sql::SqliteSchema(), db::sql::kSchemaVersion)) {
    UPLOAD_LOG_INFO("sqlite schema applied", {upload::observability::IntField("version", db::sql::kSchemaVersion)});
  }
}
#endif

#if UPLOAD_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

core::UploadOptions BuildUploadOptions(const upload::runtime::config::UploadsConfig& config) {
  core::UploadOptions options;
  if (config.multipart_threshold_bytes() > 0) options.multipart_threshold_bytes = config.multipart_threshold_bytes();
  if (config.chunk_size_bytes() > 0) options.chunk_size_bytes = config.chunk_size_bytes();
  if (config.max_batch_size() > 0) options.max_batch_size = config.max_batch_size();
  if (config.batch_parallelism() > 0) options.batch_parallelism = config.batch_parallelism();

  if (config.has_session_ttl()) options.session_ttl = util::FromProto(config.session_ttl(), options.session_ttl);
  if (config.has_presign_ttl()) options.presign_ttl = util::FromProto(config.presign_ttl(), options.presign_ttl);
  if (config.has_part_presign_ttl()) options.part_presign_ttl = util::FromProto(config.part_presign_ttl(), options.part_presign_ttl);

  options.initiate_multipart_eagerly = config.initiate_multipart_eagerly();
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const upload::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if UPLOAD_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if UPLOAD_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  UPLOAD_LOG_WARN("no database configured, using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<objectstore::ObjectStore> BuildObjectStore(const upload::runtime::config::RuntimeConfig& config) {
  const auto& store = config.object_store();
  if (store.has_s3()) {
#if UPLOAD_OBJECT_STORE_S3
    return std::make_shared<objectstore::S3ObjectStore>(store.s3());
#else
    throw std::runtime_error("s3 object store requested but not enabled at build time");
#endif
  }

  const auto base_url = store.has_memory() && !store.memory().presign_base_url().empty() ? store.memory().presign_base_url() : "memory://";
  return std::make_shared<objectstore::MemoryObjectStore>(base_url);
}

/*
    Build full application dependency graph
*/
Application Build(const upload::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Infrastructure
  // ------------------------------------------------------------------
  app.repository   = BuildRepository(config);
  app.object_store = BuildObjectStore(config);
  auto options     = BuildUploadOptions(config.uploads());

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto plans      = std::make_shared<collaborators::ConfigPlanLimitGate>(config.plans());
  auto buckets    = std::make_shared<collaborators::ConfigBucketResolver>(config.buckets());
  auto categories = std::make_shared<collaborators::ConfigCategoryDirectory>(config.categories());

  core::CompletionCollaborators completion;
  completion.categories = categories;
  completion.metadata   = std::make_shared<collaborators::SchemaMetadataWriter>(app.repository, options.now);
  completion.events     = std::make_shared<collaborators::LoggingEventSink>();
  completion.approvals  = std::make_shared<collaborators::LoggingApprovalNotifier>();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.initiator  = std::make_shared<core::SessionInitiator>(app.repository, app.object_store, plans, buckets, options);
  ctx.completion = std::make_shared<core::CompletionPipeline>(app.repository, app.object_store, completion, options);
  ctx.lifecycle  = std::make_shared<core::SessionLifecycle>(app.repository, app.object_store,
                                                           std::make_shared<collaborators::LoggingTicketSink>(), options);

  // ------------------------------------------------------------------
  // Services and gRPC servers
  // ------------------------------------------------------------------
  app.upload_service = std::make_shared<service::UploadService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::UploadServer>(app.upload_service));

  return app;
}

} // namespace upload::factory
