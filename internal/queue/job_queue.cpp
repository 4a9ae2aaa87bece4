#include "job_queue.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace jobq::queue {

using jobq::model::JobStatus;
using jobq::observability::DurationField;
using jobq::observability::IntField;
using jobq::observability::StringField;

std::string_view ToString(LifecycleOutcome outcome) {
  switch (outcome) {
    case LifecycleOutcome::kApplied:
      return "applied";
    case LifecycleOutcome::kNotOwner:
      return "not_owner";
  }
  return "unknown";
}

JobQueue::JobQueue(std::shared_ptr<db::Repository> repository, JobQueueOptions options, util::NowFn now)
    : repository_(std::move(repository)),
      options_(options),
      now_(std::move(now)),
      claimer_(std::make_shared<Claimer>(repository_, now_)) {
  if (options_.default_max_attempts <= 0) {
    options_.default_max_attempts = db::model::kDefaultMaxAttempts;
  }
  if (options_.list_page_size == 0) {
    options_.list_page_size = 10;
  }
}

db::model::JobRecord JobQueue::Push(const NewJob& job) {
  if (job.job_type.empty()) {
    throw util::InvalidArgument("enqueue: job_type must not be empty");
  }
  if (job.max_attempts && *job.max_attempts <= 0) {
    throw util::InvalidArgument("enqueue: max_attempts must be positive");
  }

  db::model::JobRecord record;
  record.id           = util::GenerateUUIDString();
  record.payload      = job.payload;
  record.job_type     = job.job_type;
  record.max_attempts = job.max_attempts.value_or(options_.default_max_attempts);
  record.run_at_ms    = util::ToUnixMillis(job.run_at.value_or(now_()));

  auto tx = repository_->Begin();
  util::ThrowIfError(repository_->InsertJob(*tx, record), "enqueue job");
  tx->Commit();

  JOBQ_LOG_DEBUG("job enqueued", {StringField("job_id", record.id), StringField("job_type", record.job_type),
                                  IntField("run_at_ms", static_cast<int64_t>(record.run_at_ms))});
  return record;
}

db::model::JobRecord JobQueue::Enqueue(const std::string& job_type, std::string payload) {
  return Push(NewJob{.job_type = job_type, .payload = std::move(payload)});
}

db::model::JobRecord JobQueue::EnqueueAt(const std::string& job_type, std::string payload, util::TimePoint when) {
  return Push(NewJob{.job_type = job_type, .payload = std::move(payload), .run_at = when});
}

std::unique_ptr<PollStream> JobQueue::Consume(const std::string& worker_id, const std::string& job_type,
                                              std::chrono::milliseconds poll_interval, TickSink sink) {
  if (worker_id.empty()) {
    throw util::InvalidArgument("consume: worker_id must not be empty");
  }
  if (job_type.empty()) {
    throw util::InvalidArgument("consume: job_type must not be empty");
  }

  auto stream = std::make_unique<PollStream>(
      claimer_, PollStreamOptions{.worker_id = worker_id, .job_type = job_type, .poll_interval = poll_interval},
      std::move(sink));
  stream->Start();
  return stream;
}

LifecycleOutcome JobQueue::Finish(const std::string& worker_id, const std::string& job_id, JobStatus status) {
  const uint64_t now_ms = util::ToUnixMillis(now_());

  auto tx     = repository_->Begin();
  auto result = repository_->SetStatusIfOwner(*tx, job_id, worker_id, status, now_ms);
  util::ThrowIfError(result, std::string("set job ") + std::string(jobq::model::ToString(status)));
  tx->Commit();

  const auto outcome = result.rows_affected > 0 ? LifecycleOutcome::kApplied : LifecycleOutcome::kNotOwner;
  if (outcome == LifecycleOutcome::kNotOwner) {
    JOBQ_LOG_WARN("lifecycle update ignored: not owner",
                  {StringField("job_id", job_id), StringField("worker_id", worker_id),
                   StringField("status", jobq::model::ToString(status))});
  } else {
    JOBQ_LOG_DEBUG("job finished", {StringField("job_id", job_id), StringField("worker_id", worker_id),
                                    StringField("status", jobq::model::ToString(status))});
  }
  return outcome;
}

LifecycleOutcome JobQueue::Ack(const std::string& worker_id, const std::string& job_id) {
  return Finish(worker_id, job_id, JobStatus::kDone);
}

LifecycleOutcome JobQueue::Kill(const std::string& worker_id, const std::string& job_id) {
  return Finish(worker_id, job_id, JobStatus::kKilled);
}

LifecycleOutcome JobQueue::Retry(const std::string& worker_id, const std::string& job_id) {
  auto tx     = repository_->Begin();
  auto result = repository_->ReleaseIfOwner(*tx, job_id, worker_id);
  util::ThrowIfError(result, "retry job");
  tx->Commit();

  if (result.rows_affected == 0) {
    JOBQ_LOG_WARN("retry ignored: not owner", {StringField("job_id", job_id), StringField("worker_id", worker_id)});
    return LifecycleOutcome::kNotOwner;
  }
  JOBQ_LOG_DEBUG("job released for retry", {StringField("job_id", job_id), StringField("worker_id", worker_id)});
  return LifecycleOutcome::kApplied;
}

void JobQueue::Reschedule(const std::string& job_id, std::chrono::milliseconds wait) {
  if (wait < std::chrono::milliseconds::zero()) {
    throw util::InvalidArgument("reschedule: wait must not be negative");
  }
  const uint64_t run_at_ms = util::ToUnixMillis(now_() + wait);

  auto tx     = repository_->Begin();
  auto result = repository_->Reschedule(*tx, job_id, run_at_ms);
  util::ThrowIfError(result, "reschedule job");
  tx->Commit();

  if (result.rows_affected == 0) {
    throw util::NotFound("reschedule: job " + job_id + " not found");
  }
  JOBQ_LOG_DEBUG("job rescheduled", {StringField("job_id", job_id), DurationField("wait", wait)});
}

void JobQueue::UpdateFields(const db::model::JobFieldUpdate& update) {
  auto tx     = repository_->Begin();
  auto result = repository_->UpdateJobFields(*tx, update);
  util::ThrowIfError(result, "update job");
  tx->Commit();

  if (result.rows_affected == 0) {
    throw util::NotFound("update: job " + update.id + " not found");
  }
}

std::optional<db::model::JobRecord> JobQueue::FetchById(const std::string& job_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetJob(*tx, job_id);
  tx->Commit();
  return record;
}

int64_t JobQueue::Len(const std::string& job_type) {
  auto tx    = repository_->Begin();
  auto count = repository_->CountPending(*tx, job_type);
  tx->Commit();
  return count;
}

std::vector<db::model::JobRecord> JobQueue::List(JobStatus status, uint64_t page,
                                                 const std::optional<std::string>& job_type) {
  if (page == 0) {
    throw util::InvalidArgument("list: page is 1-based");
  }

  db::model::Pagination pagination;
  pagination.limit  = options_.list_page_size;
  pagination.offset = (page - 1) * options_.list_page_size;

  auto tx   = repository_->Begin();
  auto jobs = repository_->ListJobs(*tx, db::model::JobFilter{.status = status, .job_type = job_type}, pagination);
  tx->Commit();
  return jobs;
}

} // namespace jobq::queue
