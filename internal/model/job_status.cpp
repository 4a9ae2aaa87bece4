#include "internal/model/job_status.hpp"

namespace jobq::model {

std::string_view ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kPending:
      return "Pending";
    case JobStatus::kRunning:
      return "Running";
    case JobStatus::kDone:
      return "Done";
    case JobStatus::kFailed:
      return "Failed";
    case JobStatus::kKilled:
      return "Killed";
  }
  return "Pending";
}

std::optional<JobStatus> ParseJobStatus(std::string_view value) {
  if (value == "Pending") return JobStatus::kPending;
  if (value == "Running") return JobStatus::kRunning;
  if (value == "Done") return JobStatus::kDone;
  if (value == "Failed") return JobStatus::kFailed;
  if (value == "Killed") return JobStatus::kKilled;
  return std::nullopt;
}

}  // namespace jobq::model
