#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/queue/typed_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/worker/worker_registry.hpp"
#include "jobq/examples/v1/email_job.pb.h"

using jobq::examples::v1::EmailJob;

int main(int argc, char** argv) try {
  // Several processes may point at the same file; each one is a worker.
  const std::string db_path   = argc > 1 ? argv[1] : "jobq-example.db";
  const std::string worker_id = argc > 2 ? argv[2] : "email-worker-1";

  auto repository = std::make_shared<jobq::db::sqlite::SqliteRepository>(
      std::make_shared<jobq::db::sqlite::SqliteDB>(jobq::db::sqlite::SqliteOptions{.path = db_path}));
  repository->EnsureSchema();

  auto queue    = std::make_shared<jobq::queue::JobQueue>(repository);
  auto registry = std::make_shared<jobq::worker::WorkerRegistry>(repository);

  jobq::queue::TypedQueue<EmailJob> emails(queue, "email");

  // Produce a few jobs, one of them deliberately undeliverable.
  for (const auto* to : {"ada@example.com", "grace@example.com", "nobody"}) {
    EmailJob job;
    job.set_to(to);
    job.set_subject("Welcome");
    job.set_body("Thanks for signing up.");
    std::cout << "enqueued " << emails.Push(job) << " -> " << to << '\n';
  }

  registry->Heartbeat(worker_id, "email");

  // Drain synchronously: claim, "send", then ack or reschedule.
  int handled = 0;
  while (auto record = queue->claimer()->ClaimNext(worker_id, emails.job_type())) {
    EmailJob email;
    try {
      email = jobq::queue::ProtoJsonCodec<EmailJob>::Decode(record->payload);
    } catch (const jobq::util::SerializationError& e) {
      std::cerr << "dropping " << record->id << ": " << e.what() << '\n';
      if (queue->Kill(worker_id, record->id) != jobq::queue::LifecycleOutcome::kApplied) {
        std::cerr << "lost ownership of " << record->id << '\n';
      }
      continue;
    }

    if (email.to().find('@') == std::string::npos) {
      std::cout << "bounce " << record->id << " (" << email.to() << "), retry in 1h\n";
      queue->Reschedule(record->id, std::chrono::hours(1));
      continue;
    }

    std::cout << "sent " << record->id << " to " << email.to() << '\n';
    if (queue->Ack(worker_id, record->id) != jobq::queue::LifecycleOutcome::kApplied) {
      std::cerr << "lost ownership of " << record->id << '\n';
      return 1;
    }
    ++handled;
  }

  std::cout << "delivered " << handled << ", still pending " << queue->Len(emails.job_type()) << '\n';
  return 0;
} catch (const std::exception& e) {
  std::cerr << "email worker failed: " << e.what() << '\n';
  return 1;
}
