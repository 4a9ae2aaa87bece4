#include "maintenance_worker.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace jobq::worker {

using jobq::observability::StringField;

namespace {

constexpr std::chrono::milliseconds kMinInterval{1};

} // namespace

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<WorkerRegistry> registry, MaintenanceOptions options)
    : registry_(std::move(registry)), options_(std::move(options)) {
  options_.heartbeat_interval = std::max(options_.heartbeat_interval, kMinInterval);
  options_.sweep_interval     = std::max(options_.sweep_interval, kMinInterval);
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void MaintenanceWorker::RunOnce() {
  HeartbeatOnce();
  SweepOnce();
}

void MaintenanceWorker::Run() {
  using Clock = std::chrono::steady_clock;

  JOBQ_LOG_INFO("maintenance started",
                {StringField("worker_id", options_.worker_id),
                 jobq::observability::DurationField("heartbeat_interval", options_.heartbeat_interval),
                 jobq::observability::DurationField("sweep_interval", options_.sweep_interval)});

  auto next_heartbeat = Clock::now();
  auto next_sweep     = Clock::now();

  while (running_) {
    const auto now = Clock::now();
    if (now >= next_heartbeat) {
      HeartbeatOnce();
      next_heartbeat = now + options_.heartbeat_interval;
    }
    if (now >= next_sweep) {
      SweepOnce();
      next_sweep = now + options_.sweep_interval;
    }

    std::unique_lock lock(mutex_);
    cv_.wait_until(lock, std::min(next_heartbeat, next_sweep), [this] { return !running_; });
  }
}

void MaintenanceWorker::HeartbeatOnce() {
  if (options_.worker_id.empty()) {
    return;
  }
  try {
    registry_->Heartbeat(options_.worker_id, options_.worker_type);
  } catch (const std::exception& e) {
    JOBQ_LOG_ERROR("heartbeat failed", {StringField("worker_id", options_.worker_id), StringField("error", e.what())});
  }
}

void MaintenanceWorker::SweepOnce() {
  for (const auto& job_type : options_.job_types) {
    try {
      registry_->SweepEnqueueScheduled(job_type, options_.sweep_batch_size);
    } catch (const std::exception& e) {
      JOBQ_LOG_ERROR("enqueue-scheduled sweep failed", {StringField("job_type", job_type), StringField("error", e.what())});
    }
    try {
      registry_->SweepReclaimOrphans(job_type, options_.sweep_batch_size, options_.liveness_timeout);
    } catch (const std::exception& e) {
      JOBQ_LOG_ERROR("orphan sweep failed", {StringField("job_type", job_type), StringField("error", e.what())});
    }
  }
}

} // namespace jobq::worker
