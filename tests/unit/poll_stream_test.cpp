#include "internal/queue/poll_stream.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/queue/tick_buffer.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using jobq::db::Result;
using jobq::db::Transaction;
using jobq::db::model::JobRecord;

// Forwards to a memory store; SelectCandidate fails while failures remain.
class FlakyRepository final : public jobq::db::Repository {
 public:
  std::atomic<int> failures{0};

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }
  std::string_view StorageName() const override {
    return "flaky";
  }
  Result InsertJob(Transaction& tx, JobRecord& record) override {
    return inner_.InsertJob(tx, record);
  }
  std::optional<JobRecord> GetJob(Transaction& tx, const std::string& id) override {
    return inner_.GetJob(tx, id);
  }
  std::optional<JobRecord> SelectCandidate(Transaction& tx, const std::string& job_type, uint64_t now_ms) override {
    if (failures.load() > 0) {
      failures.fetch_sub(1);
      throw jobq::util::StoreError(jobq::db::ErrorCode::IOError, "store unreachable");
    }
    return inner_.SelectCandidate(tx, job_type, now_ms);
  }
  Result ConditionalClaim(Transaction& tx, const std::string& id, const std::string& worker_id,
                          uint64_t now_ms) override {
    return inner_.ConditionalClaim(tx, id, worker_id, now_ms);
  }
  Result SetStatusIfOwner(Transaction& tx, const std::string& id, const std::string& worker_id,
                          jobq::model::JobStatus status, uint64_t done_at_ms) override {
    return inner_.SetStatusIfOwner(tx, id, worker_id, status, done_at_ms);
  }
  Result ReleaseIfOwner(Transaction& tx, const std::string& id, const std::string& worker_id) override {
    return inner_.ReleaseIfOwner(tx, id, worker_id);
  }
  Result Reschedule(Transaction& tx, const std::string& id, uint64_t run_at_ms) override {
    return inner_.Reschedule(tx, id, run_at_ms);
  }
  Result UpdateJobFields(Transaction& tx, const jobq::db::model::JobFieldUpdate& update) override {
    return inner_.UpdateJobFields(tx, update);
  }
  int64_t CountPending(Transaction& tx, const std::string& job_type) override {
    return inner_.CountPending(tx, job_type);
  }
  std::vector<JobRecord> ListJobs(Transaction& tx, const jobq::db::model::JobFilter& filter,
                                  const jobq::db::model::Pagination& pagination) override {
    return inner_.ListJobs(tx, filter, pagination);
  }
  Result UpsertWorker(Transaction& tx, const jobq::db::model::WorkerRecord& record) override {
    return inner_.UpsertWorker(tx, record);
  }
  std::optional<jobq::db::model::WorkerRecord> GetWorker(Transaction& tx, const std::string& id) override {
    return inner_.GetWorker(tx, id);
  }
  Result RequeueFailed(Transaction& tx, const std::string& job_type, uint64_t limit) override {
    return inner_.RequeueFailed(tx, job_type, limit);
  }
  Result RequeueOrphaned(Transaction& tx, const std::string& job_type, uint64_t limit, uint64_t cutoff_ms,
                         const std::string& marker) override {
    return inner_.RequeueOrphaned(tx, job_type, limit, cutoff_ms, marker);
  }

 private:
  jobq::db::memory::MemoryRepository inner_;
};

void TestFirstTickIsImmediate() {
  auto queue = std::make_shared<jobq::queue::JobQueue>(std::make_shared<jobq::db::memory::MemoryRepository>());
  const auto job = queue->Enqueue("email", "x");

  jobq::queue::TickBuffer buffer;
  const auto              started = std::chrono::steady_clock::now();
  auto                    stream  = queue->Consume("w1", "email", 1h, buffer.Sink());

  auto tick = buffer.PopFor(5s);
  assert(tick && tick->job && tick->job->id == job.id);
  assert(tick->job->lock_by == std::string("w1"));

  // an hour-long wait must not hold up cancellation
  stream->Cancel();
  assert(!stream->Running());
  assert(std::chrono::steady_clock::now() - started < 30s);
}

void TestEmptyTicksAtFixedRate() {
  auto queue = std::make_shared<jobq::queue::JobQueue>(std::make_shared<jobq::db::memory::MemoryRepository>());

  jobq::queue::TickBuffer buffer(true);
  auto                    stream = queue->Consume("w1", "email", 20ms, buffer.Sink());

  for (int i = 0; i < 3; ++i) {
    auto tick = buffer.PopFor(5s);
    assert(tick && tick->empty());
  }
  stream->Cancel();
  assert(stream->TickCount() >= 3);
}

void TestErrorTicksDoNotEndStream() {
  auto repository = std::make_shared<FlakyRepository>();
  auto queue      = std::make_shared<jobq::queue::JobQueue>(repository);
  const auto job  = queue->Enqueue("email", "x");
  repository->failures = 2;

  jobq::queue::TickBuffer buffer;
  auto                    stream = queue->Consume("w1", "email", 10ms, buffer.Sink());

  for (int i = 0; i < 2; ++i) {
    auto tick = buffer.PopFor(5s);
    assert(tick && tick->error && !tick->job);
    assert(tick->error->find("store unreachable") != std::string::npos);
  }
  auto tick = buffer.PopFor(5s);
  assert(tick && tick->job && tick->job->id == job.id);
  assert(stream->Running());
  stream->Cancel();
}

void TestCancelStopsClaiming() {
  auto queue = std::make_shared<jobq::queue::JobQueue>(std::make_shared<jobq::db::memory::MemoryRepository>());

  jobq::queue::TickBuffer buffer(true);
  auto                    stream = queue->Consume("w1", "email", 10ms, buffer.Sink());
  assert(buffer.PopFor(5s));
  stream->Cancel();

  const auto ticks = stream->TickCount();
  const auto job   = queue->Enqueue("email", "after-cancel");
  std::this_thread::sleep_for(50ms);

  assert(stream->TickCount() == ticks);
  assert(queue->FetchById(job.id)->status == jobq::model::JobStatus::kPending);
}

void TestTickBufferShutdownDrains() {
  jobq::queue::TickBuffer buffer;
  buffer.Push(jobq::queue::PollTick{});
  assert(buffer.Size() == 0 && "empty ticks are dropped by default");

  buffer.Push(jobq::queue::PollTick{.error = std::string("boom")});
  buffer.Shutdown();
  buffer.Push(jobq::queue::PollTick{.error = std::string("late")});

  auto tick = buffer.Pop();
  assert(tick && tick->error == std::string("boom"));
  assert(!buffer.Pop());
  assert(!buffer.PopFor(1ms));
}

} // namespace

int main() {
  TestFirstTickIsImmediate();
  TestEmptyTicksAtFixedRate();
  TestErrorTicksDoNotEndStream();
  TestCancelStopsClaiming();
  TestTickBufferShutdownDrains();

  std::cout << "jobq_unit_poll_stream: pass\n";
  return 0;
}
