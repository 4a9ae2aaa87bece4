#include "job_convert.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace jobq::service {

using jobq::model::JobStatus;

jobq::v1::JobStatus ToProto(JobStatus status) {
  switch (status) {
    case JobStatus::kPending:
      return jobq::v1::JOB_STATUS_PENDING;
    case JobStatus::kRunning:
      return jobq::v1::JOB_STATUS_RUNNING;
    case JobStatus::kDone:
      return jobq::v1::JOB_STATUS_DONE;
    case JobStatus::kFailed:
      return jobq::v1::JOB_STATUS_FAILED;
    case JobStatus::kKilled:
      return jobq::v1::JOB_STATUS_KILLED;
  }
  return jobq::v1::JOB_STATUS_UNSPECIFIED;
}

JobStatus FromProto(jobq::v1::JobStatus status) {
  switch (status) {
    case jobq::v1::JOB_STATUS_PENDING:
      return JobStatus::kPending;
    case jobq::v1::JOB_STATUS_RUNNING:
      return JobStatus::kRunning;
    case jobq::v1::JOB_STATUS_DONE:
      return JobStatus::kDone;
    case jobq::v1::JOB_STATUS_FAILED:
      return JobStatus::kFailed;
    case jobq::v1::JOB_STATUS_KILLED:
      return JobStatus::kKilled;
    default:
      throw util::InvalidArgument("job status must be specified");
  }
}

jobq::v1::Job ToProto(const jobq::db::model::JobRecord& record) {
  jobq::v1::Job job;
  job.set_id(record.id);
  job.set_payload(record.payload);
  job.set_job_type(record.job_type);
  job.set_status(ToProto(record.status));
  job.set_attempts(record.attempts);
  job.set_max_attempts(record.max_attempts);
  *job.mutable_run_at() = util::ToProto(util::FromUnixMillis(record.run_at_ms));

  if (record.last_error) job.set_last_error(*record.last_error);
  if (record.lock_at_ms) *job.mutable_lock_at() = util::ToProto(util::FromUnixMillis(*record.lock_at_ms));
  if (record.lock_by) job.set_lock_by(*record.lock_by);
  if (record.done_at_ms) *job.mutable_done_at() = util::ToProto(util::FromUnixMillis(*record.done_at_ms));
  return job;
}

}
