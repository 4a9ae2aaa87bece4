#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "worker_registry.hpp"

namespace jobq::worker {

struct MaintenanceOptions {
  std::string              worker_id;
  std::string              worker_type;
  std::vector<std::string> job_types;

  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds sweep_interval{std::chrono::seconds(60)};
  uint64_t                  sweep_batch_size = 100;
  std::chrono::milliseconds liveness_timeout = kDefaultLivenessTimeout;
};

/*
  Background worker that keeps a worker identity alive and runs the
  recovery sweeps.

  Executes:
      heartbeat                        every heartbeat_interval
      enqueue-scheduled + orphan sweep every sweep_interval, per job type
*/
class MaintenanceWorker {
 public:
  MaintenanceWorker(std::shared_ptr<WorkerRegistry> registry, MaintenanceOptions options);
  ~MaintenanceWorker();

  void Start();
  void Stop();

  // One heartbeat plus one sweep pass. Failures are logged, not thrown.
  void RunOnce();

  // Intervals are clamped to at least 1ms.
  const MaintenanceOptions& options() const {
    return options_;
  }

 private:
  void Run();
  void HeartbeatOnce();
  void SweepOnce();

  std::shared_ptr<WorkerRegistry> registry_;
  MaintenanceOptions              options_;

  std::mutex              mutex_;
  std::condition_variable cv_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace jobq::worker
