#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/job_status.hpp"

namespace jobq::db::model {

inline constexpr int32_t kDefaultMaxAttempts = 25;

/*
  Persistent job row.

  IMPORTANT:
  - status == Pending implies lock_by is unset.
  - seq is the creation-order surrogate; candidate selection orders by it.
  - Unset optionals map to NULL columns.
*/

struct JobRecord {
  uint64_t seq = 0;

  std::string id;       // UUID v4, text form
  std::string payload;  // opaque bytes
  std::string job_type;

  jobq::model::JobStatus status = jobq::model::JobStatus::kPending;

  int32_t attempts     = 0;
  int32_t max_attempts = kDefaultMaxAttempts;

  uint64_t run_at_ms = 0;

  std::optional<std::string> last_error;
  std::optional<uint64_t>    lock_at_ms;
  std::optional<std::string> lock_by;
  std::optional<uint64_t>    done_at_ms;
};

/*
  Full-field overwrite used by executors to persist attempt counts and
  error text alongside a status change.
*/
struct JobFieldUpdate {
  std::string id;

  jobq::model::JobStatus status = jobq::model::JobStatus::kPending;
  int32_t                attempts = 0;

  std::optional<uint64_t>    done_at_ms;
  std::optional<std::string> lock_by;
  std::optional<uint64_t>    lock_at_ms;
  std::optional<std::string> last_error;
};

struct JobFilter {
  jobq::model::JobStatus     status = jobq::model::JobStatus::kPending;
  std::optional<std::string> job_type;
};

struct Pagination {
  uint64_t limit  = 10;
  uint64_t offset = 0;
};

}
