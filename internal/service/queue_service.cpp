#include "queue_service.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/worker/worker_registry.hpp"
#include "job_convert.hpp"

namespace jobq::service {

using namespace jobq::v1;

namespace {

constexpr std::chrono::milliseconds kDefaultPollInterval{100};

void RequireNonEmpty(const std::string& value, const char* what) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(what) + " must not be empty");
  }
}

void RequireJobId(const std::string& job_id) {
  RequireNonEmpty(job_id, "job_id");
  if (!util::IsValidUUID(job_id)) {
    throw util::InvalidArgument("job_id is not a valid UUID: " + job_id);
  }
}

LifecycleResponse ToLifecycleResponse(jobq::queue::LifecycleOutcome outcome) {
  LifecycleResponse resp;
  resp.set_applied(outcome == jobq::queue::LifecycleOutcome::kApplied);
  return resp;
}

} // namespace

QueueService::QueueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EnqueueResponse QueueService::Enqueue(const EnqueueRequest& req) {
  RequireNonEmpty(req.job_type(), "job_type");
  if (req.max_attempts() < 0) {
    throw util::InvalidArgument("max_attempts must not be negative");
  }

  jobq::queue::NewJob job;
  job.job_type = req.job_type();
  job.payload  = req.payload();
  if (req.has_run_at()) job.run_at = util::FromProto(req.run_at());
  if (req.max_attempts() > 0) job.max_attempts = req.max_attempts();

  const auto record = ctx_.queue->Push(job);

  EnqueueResponse resp;
  resp.set_id(record.id);
  return resp;
}

GetJobResponse QueueService::GetJob(const GetJobRequest& req) {
  RequireJobId(req.id());

  auto record = ctx_.queue->FetchById(req.id());
  if (!record) {
    throw util::NotFound("job " + req.id() + " not found");
  }

  GetJobResponse resp;
  *resp.mutable_job() = ToProto(*record);
  return resp;
}

ConsumeResponse QueueService::ToResponse(const jobq::queue::PollTick& tick) {
  ConsumeResponse resp;
  if (tick.job) *resp.mutable_job() = jobq::service::ToProto(*tick.job);
  if (tick.error) resp.set_error(*tick.error);
  return resp;
}

std::unique_ptr<jobq::queue::PollStream> QueueService::Consume(const ConsumeRequest& req, jobq::queue::TickSink sink) {
  RequireNonEmpty(req.worker_id(), "worker_id");
  RequireNonEmpty(req.job_type(), "job_type");

  auto interval = req.has_poll_interval() ? util::FromProto(req.poll_interval()) : kDefaultPollInterval;
  if (interval <= std::chrono::milliseconds::zero()) {
    throw util::InvalidArgument("poll_interval must be positive");
  }

  JOBQ_LOG_INFO("consumer attached", {observability::StringField("worker_id", req.worker_id()),
                                      observability::StringField("job_type", req.job_type())});

  return ctx_.queue->Consume(req.worker_id(), req.job_type(), interval, std::move(sink));
}

std::size_t QueueService::ReleaseUndelivered(const std::string&                     worker_id,
                                             const std::vector<jobq::queue::PollTick>& ticks) {
  std::size_t released = 0;
  for (const auto& tick : ticks) {
    if (!tick.job) continue;
    try {
      if (ctx_.queue->Retry(worker_id, tick.job->id) == jobq::queue::LifecycleOutcome::kApplied) ++released;
    } catch (const util::StoreError& e) {
      // left Running; the orphan sweep recovers it once worker_id goes quiet
      JOBQ_LOG_WARN("release of undelivered job failed",
                    {observability::StringField("worker_id", worker_id),
                     observability::StringField("job_id", tick.job->id), observability::StringField("error", e.what())});
    }
  }

  if (released > 0) {
    JOBQ_LOG_INFO("released undelivered jobs", {observability::StringField("worker_id", worker_id),
                                                observability::IntField("count", static_cast<int64_t>(released))});
  }
  return released;
}

LifecycleResponse QueueService::Ack(const LifecycleRequest& req) {
  RequireNonEmpty(req.worker_id(), "worker_id");
  RequireJobId(req.job_id());
  return ToLifecycleResponse(ctx_.queue->Ack(req.worker_id(), req.job_id()));
}

LifecycleResponse QueueService::Kill(const LifecycleRequest& req) {
  RequireNonEmpty(req.worker_id(), "worker_id");
  RequireJobId(req.job_id());
  return ToLifecycleResponse(ctx_.queue->Kill(req.worker_id(), req.job_id()));
}

LifecycleResponse QueueService::Retry(const LifecycleRequest& req) {
  RequireNonEmpty(req.worker_id(), "worker_id");
  RequireJobId(req.job_id());
  return ToLifecycleResponse(ctx_.queue->Retry(req.worker_id(), req.job_id()));
}

RescheduleResponse QueueService::Reschedule(const RescheduleRequest& req) {
  RequireJobId(req.job_id());
  ctx_.queue->Reschedule(req.job_id(), util::FromProto(req.wait()));
  return {};
}

UpdateJobResponse QueueService::UpdateJob(const UpdateJobRequest& req) {
  RequireJobId(req.job_id());
  if (req.attempts() < 0) {
    throw util::InvalidArgument("attempts must not be negative");
  }

  jobq::db::model::JobFieldUpdate update;
  update.id       = req.job_id();
  update.status   = FromProto(req.status());
  update.attempts = req.attempts();
  if (req.has_done_at()) update.done_at_ms = util::ToUnixMillis(util::FromProto(req.done_at()));
  if (req.has_lock_by()) update.lock_by = req.lock_by();
  if (req.has_lock_at()) update.lock_at_ms = util::ToUnixMillis(util::FromProto(req.lock_at()));
  if (req.has_last_error()) update.last_error = req.last_error();

  ctx_.queue->UpdateFields(update);
  return {};
}

HeartbeatResponse QueueService::Heartbeat(const HeartbeatRequest& req) {
  RequireNonEmpty(req.worker_id(), "worker_id");
  ctx_.registry->Heartbeat(req.worker_id(), req.worker_type());
  return {};
}

LenResponse QueueService::Len(const LenRequest& req) {
  RequireNonEmpty(req.job_type(), "job_type");

  LenResponse resp;
  resp.set_pending(ctx_.queue->Len(req.job_type()));
  return resp;
}

ListJobsResponse QueueService::ListJobs(const ListJobsRequest& req) {
  const auto status = FromProto(req.status());
  const auto page   = req.page() == 0 ? 1u : req.page();

  std::optional<std::string> job_type;
  if (!req.job_type().empty()) job_type = req.job_type();

  ListJobsResponse resp;
  for (const auto& record : ctx_.queue->List(status, page, job_type)) {
    *resp.add_jobs() = ToProto(record);
  }
  return resp;
}

SweepResponse QueueService::Sweep(const SweepRequest& req) {
  RequireNonEmpty(req.job_type(), "job_type");

  SweepResponse resp;
  switch (req.kind()) {
    case SweepRequest::KIND_ENQUEUE_SCHEDULED:
      resp.set_requeued(ctx_.registry->SweepEnqueueScheduled(req.job_type(), req.count()));
      break;
    case SweepRequest::KIND_RECLAIM_ORPHANS: {
      const auto timeout =
          req.has_liveness_timeout() ? util::FromProto(req.liveness_timeout()) : jobq::worker::kDefaultLivenessTimeout;
      resp.set_requeued(ctx_.registry->SweepReclaimOrphans(req.job_type(), req.count(), timeout));
      break;
    }
    default:
      throw util::InvalidArgument("sweep kind must be specified");
  }
  return resp;
}

}
