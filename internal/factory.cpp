#include "factory.hpp"

#include <arrow/filesystem/s3fs.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/crypt4gh/key_file.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/mq/schema_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/s3/s3_tls.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/verify/verification_pipeline.hpp"
#include "internal/worker/sync_handler.hpp"
#include "internal/worker/verify_handler.hpp"
#if SDA_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if SDA_BROKER_AMQP
#include "internal/mq/amqp/amqp_broker.hpp"
#endif

namespace sda::factory {

using sda::observability::StringField;
using sda::runtime::config::BrokerConfig;
using sda::runtime::config::DatabaseConfig;
using sda::runtime::config::RuntimeConfig;
using sda::runtime::config::StorageConfig;

namespace {

bool UsesS3(const RuntimeConfig& config) {
  return config.archive().backend_case() == StorageConfig::kS3 || config.backup().backend_case() == StorageConfig::kS3;
}

} // namespace

db::RepositoryPtr BuildRepository(const DatabaseConfig& config) {
  switch (config.backend_case()) {
    case DatabaseConfig::kSqlite: {
      const bool wal  = config.sqlite().wal_mode();
      auto       conn = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path(), wal);
      SDA_LOG_INFO("database: sqlite", {StringField("path", config.sqlite().path())});
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(conn));
    }
    case DatabaseConfig::kPostgres: {
#if SDA_DB_POSTGRES
      const auto max_connections = config.postgres().max_connections() == 0 ? 4 : config.postgres().max_connections();
      auto       pool            = std::make_shared<db::postgres::PgPool>(config.postgres().connection_uri(), max_connections);
      SDA_LOG_INFO("database: postgres");
      return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
      throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
    }
    case DatabaseConfig::BACKEND_NOT_SET:
      break;
  }
  throw std::runtime_error("database backend not configured");
}

mq::BrokerPtr BuildBroker(const BrokerConfig& config) {
#if SDA_BROKER_AMQP
  return std::make_shared<mq::amqp::AmqpBroker>(config);
#else
  (void)config;
  throw std::runtime_error("amqp broker not enabled at build time");
#endif
}

worker::Routing RoutingFromConfig(const BrokerConfig& config) {
  worker::Routing routing;
  routing.exchange      = config.exchange();
  routing.routing_key   = config.routing_key();
  routing.routing_error = config.routing_error();
  routing.durable       = config.durable();
  return routing;
}

Worker BuildSync(const RuntimeConfig& config) {
  auto archive    = storage::StorageFactory::Build(config.archive());
  auto backup     = storage::StorageFactory::Build(config.backup());
  auto repository = BuildRepository(config.database());
  auto validator  = std::make_shared<const mq::SchemaValidator>();

  SDA_LOG_INFO("storage configured", {StringField("archive", archive->Kind()), StringField("backup", backup->Kind())});

  auto handler = std::make_shared<worker::SyncHandler>(std::move(archive), std::move(backup), std::move(repository), validator);

  Worker w;
  w.broker = BuildBroker(config.broker());
  w.loop   = std::make_unique<worker::WorkerLoop>(w.broker, validator, std::move(handler), RoutingFromConfig(config.broker()));
  return w;
}

Worker BuildVerify(const RuntimeConfig& config) {
  // Key first: a bad key or passphrase should fail before any connection is made.
  auto key      = crypt4gh::LoadPrivateKey(config.c4gh().key_path(), config.c4gh().passphrase());
  auto pipeline = std::make_shared<const verify::VerificationPipeline>(key);

  auto archive    = storage::StorageFactory::Build(config.archive());
  auto repository = BuildRepository(config.database());
  auto validator  = std::make_shared<const mq::SchemaValidator>();

  SDA_LOG_INFO("storage configured", {StringField("archive", archive->Kind())});

  auto handler = std::make_shared<worker::VerifyHandler>(std::move(archive), std::move(repository), std::move(pipeline), validator);

  Worker w;
  w.broker = BuildBroker(config.broker());
  w.loop   = std::make_unique<worker::WorkerLoop>(w.broker, validator, std::move(handler), RoutingFromConfig(config.broker()));
  return w;
}

void Shutdown(const RuntimeConfig& config) {
  if (!UsesS3(config)) return;

  auto status = arrow::fs::FinalizeS3();
  if (!status.ok()) {
    SDA_LOG_WARN("s3 finalize failed", {StringField("error", status.ToString())});
  }
  // The SDK is done with the trust store files.
  storage::s3::RemoveCaBundles();
}

} // namespace sda::factory
