#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/messaging/json_message_serializer.hpp"
#include "internal/messaging/logging_message_bus.hpp"
#include "internal/observability/logging.hpp"
#include "internal/processes/exception_handler.hpp"
#include "internal/processes/repository_command_publisher.hpp"
#include "internal/util/errors.hpp"
#if OUTBOX_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if OUTBOX_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace outbox::factory {

std::shared_ptr<db::Repository> BuildRepository(const outbox::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if OUTBOX_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    OUTBOX_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if OUTBOX_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    OUTBOX_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  OUTBOX_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const outbox::runtime::config::RuntimeConfig& config, Channels channels) {
  const bool logging_fallback = !channels.bus || !channels.scheduled_bus;
  const bool persistent       = config.database().has_sqlite() || config.database().has_postgres();
  if (logging_fallback && persistent && !config.publisher().dry_run_discard()) {
    throw util::InvalidArgument(
        "no delivery channel for a persistent store; the logging channel would discard pending commands "
        "(set publisher.dry_run_discard to allow it)");
  }

  Application app;

  // ------------------------------------------------------------------
  // Storage and serialization
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.serializer = std::make_shared<messaging::JsonMessageSerializer>();

  // ------------------------------------------------------------------
  // Delivery channels
  // ------------------------------------------------------------------
  if (logging_fallback) {
    if (persistent) {
      OUTBOX_LOG_WARN("dry run: pending commands are logged and discarded");
    }
    auto logging_bus = std::make_shared<messaging::LoggingMessageBus>();
    if (!channels.bus) channels.bus = logging_bus;
    if (!channels.scheduled_bus) channels.scheduled_bus = logging_bus;
  }
  app.bus           = std::move(channels.bus);
  app.scheduled_bus = std::move(channels.scheduled_bus);

  // ------------------------------------------------------------------
  // Publisher and store
  // ------------------------------------------------------------------
  processes::CommandPublisherOptions options;
  if (config.sweep().probe_batch_size() > 0) {
    options.probe_batch_size = config.sweep().probe_batch_size();
  }
  app.publisher =
      std::make_shared<processes::RepositoryCommandPublisher>(app.repository, app.serializer, app.bus, app.scheduled_bus, options);

  std::shared_ptr<processes::CommandPublisherExceptionHandler> handler;
  if (config.publisher().suppress_flush_failures()) {
    handler = std::make_shared<processes::LoggingCommandPublisherExceptionHandler>();
  } else {
    handler = std::make_shared<processes::DefaultCommandPublisherExceptionHandler>();
  }
  app.store = std::make_shared<processes::ProcessManagerStore>(app.repository, app.serializer, app.publisher, handler);

  // ------------------------------------------------------------------
  // Background sweep
  // ------------------------------------------------------------------
  if (config.sweep().interval_ms() > 0) {
    app.sweep_worker = std::make_unique<sweep::SweepWorker>(
        app.publisher, std::chrono::milliseconds(config.sweep().interval_ms()), config.sweep().run_on_start());
  }

  return app;
}

} // namespace outbox::factory
