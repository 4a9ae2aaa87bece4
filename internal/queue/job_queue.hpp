#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "claimer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "poll_stream.hpp"

namespace jobq::queue {

// Result of an owner-guarded lifecycle call. kNotOwner means lock_by no
// longer names the caller (reclaimed, retried or never claimed by it).
enum class LifecycleOutcome {
  kApplied,
  kNotOwner,
};

std::string_view ToString(LifecycleOutcome outcome);

struct JobQueueOptions {
  int32_t  default_max_attempts = db::model::kDefaultMaxAttempts;
  uint64_t list_page_size       = 10;
};

struct NewJob {
  std::string                    job_type;
  std::string                    payload;
  std::optional<util::TimePoint> run_at;
  std::optional<int32_t>         max_attempts;
};

/*
  Producer / consumer / lifecycle surface over a Repository.

  Every call opens its own transaction; no transaction spans claim and
  ack. Store failures surface as util::StoreError.
*/
class JobQueue {
 public:
  JobQueue(std::shared_ptr<db::Repository> repository, JobQueueOptions options = {}, util::NowFn now = util::Now);

  // ---------------------------------------------------------------------
  // Producers
  // ---------------------------------------------------------------------

  db::model::JobRecord Push(const NewJob& job);
  db::model::JobRecord Enqueue(const std::string& job_type, std::string payload);
  db::model::JobRecord EnqueueAt(const std::string& job_type, std::string payload, util::TimePoint when);

  // ---------------------------------------------------------------------
  // Consumers
  // ---------------------------------------------------------------------

  // Started stream; destroy or Cancel() to stop.
  std::unique_ptr<PollStream> Consume(const std::string& worker_id, const std::string& job_type,
                                      std::chrono::milliseconds poll_interval, TickSink sink);

  LifecycleOutcome Ack(const std::string& worker_id, const std::string& job_id);
  LifecycleOutcome Kill(const std::string& worker_id, const std::string& job_id);
  // Pending again; attempts untouched, no backoff.
  LifecycleOutcome Retry(const std::string& worker_id, const std::string& job_id);

  // Failed, unlocked, run_at = now + wait. Throws util::NotFound.
  void Reschedule(const std::string& job_id, std::chrono::milliseconds wait);

  // Unconditional overwrite. Throws util::NotFound.
  void UpdateFields(const db::model::JobFieldUpdate& update);

  // ---------------------------------------------------------------------
  // Inspection
  // ---------------------------------------------------------------------

  std::optional<db::model::JobRecord> FetchById(const std::string& job_id);
  int64_t                             Len(const std::string& job_type);

  // page is 1-based; list_page_size rows per page, creation order.
  std::vector<db::model::JobRecord> List(jobq::model::JobStatus status, uint64_t page,
                                         const std::optional<std::string>& job_type = std::nullopt);

  const std::shared_ptr<Claimer>& claimer() const {
    return claimer_;
  }

  const std::shared_ptr<db::Repository>& repository() const {
    return repository_;
  }

 private:
  LifecycleOutcome Finish(const std::string& worker_id, const std::string& job_id, jobq::model::JobStatus status);

  std::shared_ptr<db::Repository> repository_;
  JobQueueOptions                 options_;
  util::NowFn                     now_;
  std::shared_ptr<Claimer>        claimer_;
};

} // namespace jobq::queue
