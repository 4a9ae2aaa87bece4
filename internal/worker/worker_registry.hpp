#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace jobq::worker {

inline constexpr std::chrono::milliseconds kDefaultLivenessTimeout = std::chrono::minutes(5);
inline constexpr const char*               kAbandonedMarker        = "Job was abandoned";

/*
  Worker heartbeats and the two recovery sweeps.

  Liveness is inferred from workers.last_seen_ms; nothing is ever deleted.
  Sweeps never touch attempts.
*/
class WorkerRegistry {
 public:
  WorkerRegistry(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  // Upsert {worker_id, worker_type, storage name, last_seen = now}.
  void Heartbeat(const std::string& worker_id, const std::string& worker_type);

  std::optional<db::model::WorkerRecord> Get(const std::string& worker_id);

  // Failed jobs with attempts < max_attempts back to Pending, oldest
  // lock_at first. Returns the number reset.
  uint64_t SweepEnqueueScheduled(const std::string& job_type, uint64_t count);

  // Running jobs whose owner was last seen strictly before now - timeout,
  // back to Pending with last_error = kAbandonedMarker. Returns the number reset.
  uint64_t SweepReclaimOrphans(const std::string& job_type, uint64_t count,
                               std::chrono::milliseconds liveness_timeout = kDefaultLivenessTimeout);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace jobq::worker
