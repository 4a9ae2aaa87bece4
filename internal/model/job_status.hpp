#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace jobq::model {

enum class JobStatus : std::uint8_t {
  kPending = 0,
  kRunning = 1,
  kDone    = 2,
  kFailed  = 3,
  kKilled  = 4,
};

// Stored spelling of each status ("Pending", "Running", ...).
std::string_view ToString(JobStatus status);
std::optional<JobStatus> ParseJobStatus(std::string_view value);

constexpr bool IsTerminal(JobStatus status) {
  return status == JobStatus::kDone || status == JobStatus::kKilled;
}

/*
  Lifecycle graph:

    Pending --claim--> Running --ack--> Done
    Running --kill--> Killed
    Running --retry / orphan sweep--> Pending
    Running --reschedule--> Failed
    Failed  --sweep--> Pending
    Failed  --claim (attempts < max_attempts)--> Running
*/
constexpr bool CanTransition(JobStatus from, JobStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case JobStatus::kPending:
      return to == JobStatus::kRunning;
    case JobStatus::kRunning:
      return true;
    case JobStatus::kFailed:
      return to == JobStatus::kPending || to == JobStatus::kRunning;
    default:
      return false;
  }
}

}  // namespace jobq::model
