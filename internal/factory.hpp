#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/service/queue_service.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/maintenance_worker.hpp"
#include "internal/worker/worker_registry.hpp"

namespace jobq::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<queue::JobQueue>        queue;
  std::shared_ptr<worker::WorkerRegistry> registry;

  // null when maintenance.enabled is false
  std::shared_ptr<worker::MaintenanceWorker> maintenance;

  std::shared_ptr<service::QueueService> queue_service;
};

/*
  Builds the configured store and bootstraps its schema.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const jobq::runtime::config::RuntimeConfig& config);

// Build full application dependency graph; starts the maintenance worker.
Application Build(const jobq::runtime::config::RuntimeConfig& config, util::NowFn now = util::Now);

} // namespace jobq::factory
