#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/queue/tick_buffer.hpp"
#include "internal/queue/typed_queue.hpp"
#include "internal/worker/worker_registry.hpp"
#include "jobq/examples/v1/email_job.pb.h"
#include "tests/support/manual_clock.hpp"

namespace {

using namespace std::chrono_literals;
using jobq::examples::v1::EmailJob;
using jobq::model::JobStatus;
using jobq::queue::LifecycleOutcome;

struct Cluster {
  jobq::testing::ManualClock                    clock;
  std::shared_ptr<jobq::db::Repository>         repository = std::make_shared<jobq::db::memory::MemoryRepository>();
  std::shared_ptr<jobq::queue::JobQueue>        queue;
  std::shared_ptr<jobq::worker::WorkerRegistry> registry;

  Cluster() {
    queue    = std::make_shared<jobq::queue::JobQueue>(repository, jobq::queue::JobQueueOptions{}, clock.Fn());
    registry = std::make_shared<jobq::worker::WorkerRegistry>(repository, clock.Fn());
  }
};

EmailJob Email(const std::string& to) {
  EmailJob email;
  email.set_to(to);
  email.set_subject("Hi");
  return email;
}

// Two consumers poll a single email job at once: one stream delivers it,
// the other sees an empty tick, and the ack leaves the queue empty.
void TestConcurrentConsumersShareOneJob() {
  Cluster c;

  const auto job = c.queue->Enqueue("email", "{\"to\":\"a@example.com\"}");

  jobq::queue::TickBuffer w1_ticks(/*keep_empty=*/true);
  jobq::queue::TickBuffer w2_ticks(/*keep_empty=*/true);
  auto                    w1 = c.queue->Consume("W1", "email", 1h, w1_ticks.Sink());
  auto                    w2 = c.queue->Consume("W2", "email", 1h, w2_ticks.Sink());

  auto first  = w1_ticks.PopFor(5s);
  auto second = w2_ticks.PopFor(5s);
  w1->Cancel();
  w2->Cancel();
  assert(first && second);
  assert(!first->error && !second->error);
  assert(static_cast<bool>(first->job) != static_cast<bool>(second->job));

  const auto& winner = first->job ? *first->job : *second->job;
  const auto  owner  = first->job ? "W1" : "W2";
  const auto  loser  = first->job ? "W2" : "W1";
  assert(winner.id == job.id);
  assert(winner.lock_by == std::string(owner));

  assert(c.queue->Ack(loser, job.id) == LifecycleOutcome::kNotOwner);
  assert(c.queue->Ack(owner, job.id) == LifecycleOutcome::kApplied);
  assert(c.queue->Len("email") == 0);
  assert(c.queue->FetchById(job.id)->status == JobStatus::kDone);
}

// Two workers share the email queue; one dies mid-job and the survivor
// finishes its work after the orphan sweep.
void TestCrashedWorkerJobIsRecovered() {
  Cluster                           c;
  jobq::queue::TypedQueue<EmailJob> emails(c.queue, "email");

  const auto first  = emails.Push(Email("one@example.com"));
  const auto second = emails.Push(Email("two@example.com"));

  c.registry->Heartbeat("worker-a", "email");
  c.registry->Heartbeat("worker-b", "email");

  auto a_job = c.queue->claimer()->ClaimNext("worker-a", "email");
  auto b_job = c.queue->claimer()->ClaimNext("worker-b", "email");
  assert(a_job && a_job->id == first);
  assert(b_job && b_job->id == second);

  c.clock.Advance(2s);
  assert(c.queue->Ack("worker-a", first) == LifecycleOutcome::kApplied);

  // worker-b stops heartbeating
  for (int i = 0; i < 12; ++i) {
    c.clock.Advance(30s);
    c.registry->Heartbeat("worker-a", "email");
  }

  assert(c.registry->SweepReclaimOrphans("email", 100) == 1);

  auto recovered = c.queue->claimer()->ClaimNext("worker-a", "email");
  assert(recovered && recovered->id == second);
  assert(recovered->last_error == std::string(jobq::worker::kAbandonedMarker));
  assert(c.queue->Ack("worker-a", second) == LifecycleOutcome::kApplied);

  // late ack from the crashed worker is ignored
  assert(c.queue->Ack("worker-b", second) == LifecycleOutcome::kNotOwner);

  const auto done = c.queue->List(JobStatus::kDone, 1, std::string("email"));
  assert(done.size() == 2);
  for (const auto& job : done) {
    assert(job.lock_by == std::string("worker-a"));
  }
  assert(emails.Fetch(second)->payload.to() == "two@example.com");
}

// An executor counting its own attempts drives a job into the dead-letter
// state: Failed with attempts == max_attempts is never claimed or swept.
void TestExhaustedJobIsDeadLettered() {
  Cluster c;

  const auto job =
      c.queue->Push(jobq::queue::NewJob{.job_type = "email", .payload = "x", .max_attempts = 3});

  for (int attempt = 1; attempt <= 3; ++attempt) {
    auto claimed = c.queue->claimer()->ClaimNext("worker-a", "email");
    assert(claimed && claimed->id == job.id);
    assert(claimed->attempts == attempt - 1);

    c.queue->UpdateFields(jobq::db::model::JobFieldUpdate{.id         = job.id,
                                                          .status     = JobStatus::kRunning,
                                                          .attempts   = attempt,
                                                          .done_at_ms = std::nullopt,
                                                          .lock_by    = claimed->lock_by,
                                                          .lock_at_ms = claimed->lock_at_ms,
                                                          .last_error = std::string("smtp timeout")});
    c.queue->Reschedule(job.id, 1s);
    c.clock.Advance(1s);
  }

  c.clock.Advance(1h);
  assert(!c.queue->claimer()->ClaimNext("worker-a", "email"));
  assert(c.registry->SweepEnqueueScheduled("email", 100) == 0);

  const auto failed = c.queue->List(JobStatus::kFailed, 1);
  assert(failed.size() == 1);
  assert(failed.front().attempts == 3);
  assert(failed.front().last_error == std::string("smtp timeout"));

  // an operator reset to Pending makes it claimable again
  c.queue->UpdateFields(
      jobq::db::model::JobFieldUpdate{.id = job.id, .status = JobStatus::kPending, .attempts = 3});
  assert(c.queue->claimer()->ClaimNext("worker-a", "email"));
}

} // namespace

int main() {
  TestConcurrentConsumersShareOneJob();
  TestCrashedWorkerJobIsRecovered();
  TestExhaustedJobIsDeadLettered();

  std::cout << "jobq_unit_scenario: pass\n";
  return 0;
}
