#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if JOBQ_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if JOBQ_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace jobq::factory {

using jobq::observability::StringField;

namespace {

std::chrono::milliseconds DurationOr(bool has, const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  if (!has) return fallback;
  auto value = util::FromProto(d);
  return value > std::chrono::milliseconds::zero() ? value : fallback;
}

worker::MaintenanceOptions ToMaintenanceOptions(const jobq::runtime::config::MaintenanceConfig& cfg) {
  worker::MaintenanceOptions options;
  options.worker_id   = cfg.worker_id();
  options.worker_type = cfg.worker_type();
  options.job_types.assign(cfg.job_types().begin(), cfg.job_types().end());
  options.heartbeat_interval =
      DurationOr(cfg.has_heartbeat_interval(), cfg.heartbeat_interval(), options.heartbeat_interval);
  options.sweep_interval   = DurationOr(cfg.has_sweep_interval(), cfg.sweep_interval(), options.sweep_interval);
  options.liveness_timeout = DurationOr(cfg.has_liveness_timeout(), cfg.liveness_timeout(), options.liveness_timeout);
  if (cfg.sweep_batch_size() > 0) options.sweep_batch_size = cfg.sweep_batch_size();
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const jobq::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if JOBQ_DB_SQLITE
    const auto& cfg = database.sqlite();

    db::sqlite::SqliteOptions options;
    if (!cfg.path().empty()) options.path = cfg.path();
    if (cfg.has_wal_mode()) options.wal_mode = cfg.wal_mode();
    if (cfg.busy_timeout_ms() > 0) options.busy_timeout_ms = static_cast<int>(cfg.busy_timeout_ms());

    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::make_shared<db::sqlite::SqliteDB>(options));
    repository->EnsureSchema();
    JOBQ_LOG_INFO("store ready", {StringField("backend", "sqlite"), StringField("path", options.path)});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if JOBQ_DB_POSTGRES
    const auto& cfg  = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(
        cfg.connection_uri(), cfg.max_connections() > 0 ? cfg.max_connections() : 16);
    auto repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->EnsureSchema();
    JOBQ_LOG_INFO("store ready", {StringField("backend", "postgres")});
    return repository;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  JOBQ_LOG_INFO("store ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const jobq::runtime::config::RuntimeConfig& config, util::NowFn now) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  queue::JobQueueOptions queue_options;
  if (config.queue().default_max_attempts() > 0) {
    queue_options.default_max_attempts = static_cast<int32_t>(config.queue().default_max_attempts());
  }
  if (config.queue().list_page_size() > 0) {
    queue_options.list_page_size = config.queue().list_page_size();
  }

  app.queue    = std::make_shared<queue::JobQueue>(app.repository, queue_options, now);
  app.registry = std::make_shared<worker::WorkerRegistry>(app.repository, now);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  if (config.maintenance().enabled()) {
    app.maintenance = std::make_shared<worker::MaintenanceWorker>(app.registry, ToMaintenanceOptions(config.maintenance()));
    app.maintenance->Start();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.queue    = app.queue;
  ctx.registry = app.registry;

  app.queue_service = std::make_shared<service::QueueService>(ctx);

  return app;
}

} // namespace jobq::factory
