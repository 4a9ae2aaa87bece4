#include "internal/worker/worker_registry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/worker/maintenance_worker.hpp"
#include "tests/support/manual_clock.hpp"

namespace {

using namespace std::chrono_literals;
using jobq::model::JobStatus;

struct Fixture {
  jobq::testing::ManualClock                    clock;
  std::shared_ptr<jobq::db::Repository>         repository = std::make_shared<jobq::db::memory::MemoryRepository>();
  std::shared_ptr<jobq::queue::JobQueue>        queue;
  std::shared_ptr<jobq::worker::WorkerRegistry> registry;

  Fixture() {
    queue    = std::make_shared<jobq::queue::JobQueue>(repository, jobq::queue::JobQueueOptions{}, clock.Fn());
    registry = std::make_shared<jobq::worker::WorkerRegistry>(repository, clock.Fn());
  }
};

void TestHeartbeatUpsertsSingleRow() {
  Fixture f;

  f.registry->Heartbeat("w1", "email-worker");
  auto worker = f.registry->Get("w1");
  assert(worker);
  assert(worker->worker_type == "email-worker");
  assert(worker->storage_name == "memory");
  assert(worker->last_seen_ms == f.clock.NowMs());

  f.clock.Advance(30s);
  f.registry->Heartbeat("w1", "email-worker");
  worker = f.registry->Get("w1");
  assert(worker->last_seen_ms == f.clock.NowMs());

  assert(!f.registry->Get("w2"));
}

void TestOrphanCutoffIsStrict() {
  Fixture f;

  const auto job = f.queue->Enqueue("email", "x");
  f.registry->Heartbeat("w1", "email-worker");
  assert(f.queue->claimer()->ClaimNext("w1", "email"));

  // last_seen == now - 5min is still alive
  f.clock.Advance(5min);
  assert(f.registry->SweepReclaimOrphans("email", 10) == 0);
  assert(f.queue->FetchById(job.id)->status == JobStatus::kRunning);

  f.clock.Advance(1ms);
  assert(f.registry->SweepReclaimOrphans("email", 10) == 1);

  const auto stored = f.queue->FetchById(job.id);
  assert(stored->status == JobStatus::kPending);
  assert(!stored->lock_by && !stored->lock_at_ms && !stored->done_at_ms);
  assert(stored->last_error == std::string(jobq::worker::kAbandonedMarker));
  assert(stored->attempts == 0);

  // former owner can no longer finish it
  assert(f.queue->Ack("w1", job.id) == jobq::queue::LifecycleOutcome::kNotOwner);
}

void TestHeartbeatingWorkerKeepsItsJobs() {
  Fixture f;

  const auto job = f.queue->Enqueue("email", "x");
  f.registry->Heartbeat("w1", "email-worker");
  assert(f.queue->claimer()->ClaimNext("w1", "email"));

  f.clock.Advance(4min);
  f.registry->Heartbeat("w1", "email-worker");
  f.clock.Advance(2min);

  assert(f.registry->SweepReclaimOrphans("email", 10) == 0);
  assert(f.queue->FetchById(job.id)->lock_by == std::string("w1"));

  // shorter timeout catches it
  assert(f.registry->SweepReclaimOrphans("email", 10, 1min) == 1);
}

void TestUnregisteredOwnerIsNotReclaimed() {
  Fixture f;

  const auto job = f.queue->Enqueue("email", "x");
  assert(f.queue->claimer()->ClaimNext("ghost", "email"));

  f.clock.Advance(24h);
  assert(f.registry->SweepReclaimOrphans("email", 10) == 0);
  assert(f.queue->FetchById(job.id)->status == JobStatus::kRunning);
}

void TestOrphanSweepIsScopedByJobType() {
  Fixture f;

  f.registry->Heartbeat("w1", "mixed");
  (void)f.queue->Enqueue("email", "x");
  (void)f.queue->Enqueue("sms", "y");
  assert(f.queue->claimer()->ClaimNext("w1", "email"));
  assert(f.queue->claimer()->ClaimNext("w1", "sms"));

  f.clock.Advance(10min);
  assert(f.registry->SweepReclaimOrphans("sms", 10) == 1);
  assert(f.queue->Len("email") == 0);
  assert(f.queue->Len("sms") == 1);
}

void TestEnqueueScheduledBatchBound() {
  Fixture f;

  std::vector<std::string> ids;
  for (int i = 0; i < 5; ++i) {
    ids.push_back(f.queue->Enqueue("email", std::to_string(i)).id);
  }
  for (int i = 0; i < 5; ++i) {
    auto job = f.queue->claimer()->ClaimNext("w1", "email");
    assert(job);
    f.queue->Reschedule(job->id, 1h);
  }
  assert(f.queue->Len("email") == 0);

  assert(f.registry->SweepEnqueueScheduled("email", 0) == 0);
  assert(f.registry->SweepEnqueueScheduled("email", 3) == 3);
  assert(f.queue->Len("email") == 3);

  const auto pending = f.queue->List(JobStatus::kPending, 1);
  assert(pending.size() == 3);
  for (int i = 0; i < 3; ++i) {
    assert(pending[i].id == ids[i]);
  }

  assert(f.registry->SweepEnqueueScheduled("email", 3) == 2);
  assert(f.registry->SweepEnqueueScheduled("email", 3) == 0);

  // run_at still gates the claim after the sweep
  assert(!f.queue->claimer()->ClaimNext("w1", "email"));
  f.clock.Advance(1h);
  assert(f.queue->claimer()->ClaimNext("w1", "email"));
}

void TestEnqueueScheduledSkipsExhaustedJobs() {
  Fixture f;

  const auto job = f.queue->Push(jobq::queue::NewJob{.job_type = "email", .payload = "x", .max_attempts = 2});
  assert(f.queue->claimer()->ClaimNext("w1", "email"));
  f.queue->UpdateFields(jobq::db::model::JobFieldUpdate{.id = job.id, .status = JobStatus::kFailed, .attempts = 2});

  assert(f.registry->SweepEnqueueScheduled("email", 10) == 0);
  assert(f.queue->FetchById(job.id)->status == JobStatus::kFailed);
}

void TestMaintenanceRunOnce() {
  Fixture f;

  const auto job = f.queue->Enqueue("email", "x");
  f.registry->Heartbeat("w-dead", "email-worker");
  assert(f.queue->claimer()->ClaimNext("w-dead", "email"));
  f.clock.Advance(6min);

  jobq::worker::MaintenanceWorker maintenance(
      f.registry, jobq::worker::MaintenanceOptions{.worker_id = "w-maint", .worker_type = "maintenance",
                                                   .job_types = {"email"}});
  maintenance.RunOnce();

  const auto self = f.registry->Get("w-maint");
  assert(self && self->last_seen_ms == f.clock.NowMs());
  assert(f.queue->FetchById(job.id)->status == JobStatus::kPending);
}

void TestMaintenanceThreadHeartbeats() {
  Fixture f;

  jobq::worker::MaintenanceWorker maintenance(
      f.registry, jobq::worker::MaintenanceOptions{.worker_id          = "w-maint",
                                                   .worker_type        = "maintenance",
                                                   .job_types          = {"email"},
                                                   .heartbeat_interval = 10ms,
                                                   .sweep_interval     = 10ms});
  maintenance.Start();
  for (int i = 0; i < 500 && !f.registry->Get("w-maint"); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  maintenance.Stop();
  assert(f.registry->Get("w-maint"));
}

void TestMaintenanceClampsZeroIntervals() {
  Fixture f;

  jobq::worker::MaintenanceWorker maintenance(
      f.registry, jobq::worker::MaintenanceOptions{.worker_id          = "w-maint",
                                                   .worker_type        = "maintenance",
                                                   .job_types          = {"email"},
                                                   .heartbeat_interval = 0ms,
                                                   .sweep_interval     = -5ms});
  assert(maintenance.options().heartbeat_interval == 1ms);
  assert(maintenance.options().sweep_interval == 1ms);

  maintenance.Start();
  for (int i = 0; i < 500 && !f.registry->Get("w-maint"); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  maintenance.Stop();
  assert(f.registry->Get("w-maint"));
}

} // namespace

int main() {
  TestHeartbeatUpsertsSingleRow();
  TestOrphanCutoffIsStrict();
  TestHeartbeatingWorkerKeepsItsJobs();
  TestUnregisteredOwnerIsNotReclaimed();
  TestOrphanSweepIsScopedByJobType();
  TestEnqueueScheduledBatchBound();
  TestEnqueueScheduledSkipsExhaustedJobs();
  TestMaintenanceRunOnce();
  TestMaintenanceThreadHeartbeats();
  TestMaintenanceClampsZeroIntervals();

  std::cout << "jobq_unit_worker_registry: pass\n";
  return 0;
}
