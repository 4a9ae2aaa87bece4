#include "internal/service/queue_service.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/queue/tick_buffer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/manual_clock.hpp"

namespace {

using namespace std::chrono_literals;
using namespace jobq::v1;

struct Fixture {
  jobq::testing::ManualClock      clock;
  jobq::factory::Application      app;
  jobq::service::QueueService*    service = nullptr;

  explicit Fixture(const std::string& yaml = "database:\n  memory: {}\n") {
    app     = jobq::factory::Build(jobq::config::ConfigLoader::LoadFromString(yaml), clock.Fn());
    service = app.queue_service.get();
  }
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

std::string EnqueueEmail(Fixture& f, int32_t max_attempts = 0) {
  EnqueueRequest req;
  req.set_job_type("email");
  req.set_payload("{\"to\":\"a@example.com\"}");
  req.set_max_attempts(max_attempts);
  return f.service->Enqueue(req).id();
}

LifecycleRequest Lifecycle(const std::string& worker, const std::string& job) {
  LifecycleRequest req;
  req.set_worker_id(worker);
  req.set_job_id(job);
  return req;
}

void TestEnqueueAndGet() {
  Fixture f;
  const auto id = EnqueueEmail(f, 7);
  assert(jobq::util::IsValidUUID(id));

  GetJobRequest get;
  get.set_id(id);
  const auto job = f.service->GetJob(get).job();
  assert(job.status() == JOB_STATUS_PENDING);
  assert(job.max_attempts() == 7);
  assert(job.payload() == "{\"to\":\"a@example.com\"}");
  assert(job.run_at().seconds() == static_cast<int64_t>(f.clock.NowMs() / 1000));
  assert(!job.has_lock_by() && !job.has_lock_at() && !job.has_done_at() && !job.has_last_error());

  LenRequest len;
  len.set_job_type("email");
  assert(f.service->Len(len).pending() == 1);
}

void TestRequestValidation() {
  Fixture f;

  assert(Throws<jobq::util::InvalidArgument>([&] { (void)f.service->Enqueue(EnqueueRequest{}); }));

  GetJobRequest bad_id;
  bad_id.set_id("not-a-uuid");
  assert(Throws<jobq::util::InvalidArgument>([&] { (void)f.service->GetJob(bad_id); }));

  GetJobRequest missing;
  missing.set_id(jobq::util::GenerateUUIDString());
  assert(Throws<jobq::util::NotFound>([&] { (void)f.service->GetJob(missing); }));

  ListJobsRequest list;
  assert(Throws<jobq::util::InvalidArgument>([&] { (void)f.service->ListJobs(list); }));

  SweepRequest sweep;
  sweep.set_job_type("email");
  assert(Throws<jobq::util::InvalidArgument>([&] { (void)f.service->Sweep(sweep); }));

  assert(Throws<jobq::util::InvalidArgument>([&] { (void)f.service->Ack(Lifecycle("", EnqueueEmail(f))); }));

  ConsumeRequest consume;
  consume.set_worker_id("w1");
  consume.set_job_type("email");
  consume.mutable_poll_interval()->set_seconds(-1);
  assert(Throws<jobq::util::InvalidArgument>([&] { (void)f.service->Consume(consume, [](jobq::queue::PollTick) {}); }));
}

void TestConsumeAckFlow() {
  Fixture f;
  const auto id = EnqueueEmail(f);

  ConsumeRequest consume;
  consume.set_worker_id("w1");
  consume.set_job_type("email");

  jobq::queue::TickBuffer buffer;
  auto                    stream = f.service->Consume(consume, buffer.Sink());
  auto                    tick   = buffer.PopFor(5s);
  stream->Cancel();
  assert(tick);

  const auto resp = jobq::service::QueueService::ToResponse(*tick);
  assert(resp.has_job() && resp.error().empty());
  assert(resp.job().id() == id);
  assert(resp.job().status() == JOB_STATUS_RUNNING);
  assert(resp.job().lock_by() == "w1");

  assert(!f.service->Ack(Lifecycle("w2", id)).applied());
  assert(f.service->Ack(Lifecycle("w1", id)).applied());

  ListJobsRequest list;
  list.set_status(JOB_STATUS_DONE);
  const auto done = f.service->ListJobs(list);
  assert(done.jobs_size() == 1);
  assert(done.jobs(0).has_done_at());
}

// A consumer that goes away mid-stream: one tick failed to reach the
// client, one more is still buffered. Both jobs go back to Pending.
void TestUndeliveredTicksAreReleased() {
  Fixture f;
  const auto first  = EnqueueEmail(f);
  const auto second = EnqueueEmail(f);
  const auto acked  = EnqueueEmail(f);

  ConsumeRequest consume;
  consume.set_worker_id("w1");
  consume.set_job_type("email");
  consume.mutable_poll_interval()->set_nanos(5'000'000);

  jobq::queue::TickBuffer buffer;
  auto                    stream = f.service->Consume(consume, buffer.Sink());
  for (int i = 0; i < 500 && buffer.Size() < 3; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  stream->Cancel();
  buffer.Shutdown();

  auto ticks = buffer.Drain();
  assert(ticks.size() == 3);
  assert(ticks[2].job && ticks[2].job->id == acked);

  // a job the consumer already finished is not released
  assert(f.service->Ack(Lifecycle("w1", acked)).applied());

  jobq::queue::PollTick error_tick;
  error_tick.error = "store unreachable";
  ticks.push_back(error_tick);
  ticks.push_back(jobq::queue::PollTick{});
  assert(f.service->ReleaseUndelivered("w1", ticks) == 2);

  for (const auto& id : {first, second}) {
    GetJobRequest get;
    get.set_id(id);
    const auto job = f.service->GetJob(get).job();
    assert(job.status() == JOB_STATUS_PENDING);
    assert(!job.has_lock_by());
  }

  GetJobRequest get;
  get.set_id(acked);
  assert(f.service->GetJob(get).job().status() == JOB_STATUS_DONE);

  LenRequest len;
  len.set_job_type("email");
  assert(f.service->Len(len).pending() == 2);
  assert(buffer.Drain().empty());
}

void TestErrorTickRendersMessage() {
  jobq::queue::PollTick tick;
  tick.error = "store unreachable";

  const auto resp = jobq::service::QueueService::ToResponse(tick);
  assert(!resp.has_job());
  assert(resp.error() == "store unreachable");

  assert(!jobq::service::QueueService::ToResponse(jobq::queue::PollTick{}).has_job());
}

void TestRescheduleUpdateAndSweep() {
  Fixture f;
  const auto id = EnqueueEmail(f);
  assert(f.app.queue->claimer()->ClaimNext("w1", "email"));

  RescheduleRequest reschedule;
  reschedule.set_job_id(id);
  reschedule.mutable_wait()->set_seconds(60);
  (void)f.service->Reschedule(reschedule);

  UpdateJobRequest update;
  update.set_job_id(id);
  update.set_status(JOB_STATUS_FAILED);
  update.set_attempts(1);
  update.set_last_error("bounced");
  (void)f.service->UpdateJob(update);

  GetJobRequest get;
  get.set_id(id);
  auto job = f.service->GetJob(get).job();
  assert(job.status() == JOB_STATUS_FAILED);
  assert(job.attempts() == 1);
  assert(job.last_error() == "bounced");

  SweepRequest sweep;
  sweep.set_kind(SweepRequest::KIND_ENQUEUE_SCHEDULED);
  sweep.set_job_type("email");
  sweep.set_count(10);
  assert(f.service->Sweep(sweep).requeued() == 1);
  assert(f.service->GetJob(get).job().status() == JOB_STATUS_PENDING);

  UpdateJobRequest unknown;
  unknown.set_job_id(jobq::util::GenerateUUIDString());
  unknown.set_status(JOB_STATUS_PENDING);
  assert(Throws<jobq::util::NotFound>([&] { (void)f.service->UpdateJob(unknown); }));
}

void TestHeartbeatAndOrphanSweep() {
  Fixture f;
  const auto id = EnqueueEmail(f);

  HeartbeatRequest hb;
  hb.set_worker_id("w1");
  hb.set_worker_type("email");
  (void)f.service->Heartbeat(hb);
  assert(f.app.queue->claimer()->ClaimNext("w1", "email"));

  f.clock.Advance(2min);

  SweepRequest sweep;
  sweep.set_kind(SweepRequest::KIND_RECLAIM_ORPHANS);
  sweep.set_job_type("email");
  sweep.set_count(10);
  assert(f.service->Sweep(sweep).requeued() == 0);

  sweep.mutable_liveness_timeout()->set_seconds(60);
  assert(f.service->Sweep(sweep).requeued() == 1);

  GetJobRequest get;
  get.set_id(id);
  assert(f.service->GetJob(get).job().last_error() == "Job was abandoned");
}

void TestFactoryAppliesQueueOptions() {
  Fixture f("database:\n  memory: {}\nqueue:\n  default_max_attempts: 3\n  list_page_size: 2\n");
  for (int i = 0; i < 5; ++i) {
    (void)EnqueueEmail(f);
  }

  ListJobsRequest list;
  list.set_status(JOB_STATUS_PENDING);
  list.set_page(0);
  const auto page = f.service->ListJobs(list);
  assert(page.jobs_size() == 2);
  assert(page.jobs(0).max_attempts() == 3);

  list.set_page(3);
  assert(f.service->ListJobs(list).jobs_size() == 1);
  assert(!f.app.maintenance);
}

void TestFactoryOpensSqlite() {
  const auto dir = std::filesystem::temp_directory_path() / "jobq_queue_service_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "factory.db";
  std::filesystem::remove(path);

  Fixture f("database:\n  sqlite:\n    path: \"" + path.string() + "\"\n");
  assert(f.app.repository->StorageName() == "sqlite");

  const auto id = EnqueueEmail(f);
  GetJobRequest get;
  get.set_id(id);
  assert(f.service->GetJob(get).job().status() == JOB_STATUS_PENDING);
}

} // namespace

int main() {
  TestEnqueueAndGet();
  TestRequestValidation();
  TestConsumeAckFlow();
  TestUndeliveredTicksAreReleased();
  TestErrorTickRendersMessage();
  TestRescheduleUpdateAndSweep();
  TestHeartbeatAndOrphanSweep();
  TestFactoryAppliesQueueOptions();
  TestFactoryOpensSqlite();

  std::cout << "jobq_unit_queue_service: pass\n";
  return 0;
}
