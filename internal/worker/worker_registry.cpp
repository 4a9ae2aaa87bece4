#include "worker_registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobq::worker {

using jobq::observability::DurationField;
using jobq::observability::IntField;
using jobq::observability::StringField;

WorkerRegistry::WorkerRegistry(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

void WorkerRegistry::Heartbeat(const std::string& worker_id, const std::string& worker_type) {
  if (worker_id.empty()) {
    throw util::InvalidArgument("heartbeat: worker_id must not be empty");
  }

  db::model::WorkerRecord record;
  record.id           = worker_id;
  record.worker_type  = worker_type;
  record.storage_name = std::string(repository_->StorageName());
  record.last_seen_ms = util::ToUnixMillis(now_());

  auto tx = repository_->Begin();
  util::ThrowIfError(repository_->UpsertWorker(*tx, record), "heartbeat");
  tx->Commit();
}

std::optional<db::model::WorkerRecord> WorkerRegistry::Get(const std::string& worker_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetWorker(*tx, worker_id);
  tx->Commit();
  return record;
}

uint64_t WorkerRegistry::SweepEnqueueScheduled(const std::string& job_type, uint64_t count) {
  if (count == 0) {
    return 0;
  }

  auto tx     = repository_->Begin();
  auto result = repository_->RequeueFailed(*tx, job_type, count);
  util::ThrowIfError(result, "enqueue scheduled");
  tx->Commit();

  if (result.rows_affected > 0) {
    JOBQ_LOG_INFO("scheduled jobs requeued", {StringField("job_type", job_type),
                                              IntField("count", static_cast<int64_t>(result.rows_affected))});
  }
  return result.rows_affected;
}

uint64_t WorkerRegistry::SweepReclaimOrphans(const std::string& job_type, uint64_t count,
                                             std::chrono::milliseconds liveness_timeout) {
  if (count == 0) {
    return 0;
  }

  const uint64_t now_ms     = util::ToUnixMillis(now_());
  const auto     timeout_ms = static_cast<uint64_t>(std::max<int64_t>(liveness_timeout.count(), 0));
  const uint64_t cutoff_ms  = now_ms > timeout_ms ? now_ms - timeout_ms : 0;

  auto tx     = repository_->Begin();
  auto result = repository_->RequeueOrphaned(*tx, job_type, count, cutoff_ms, kAbandonedMarker);
  util::ThrowIfError(result, "reclaim orphans");
  tx->Commit();

  if (result.rows_affected > 0) {
    JOBQ_LOG_WARN("orphaned jobs reclaimed", {StringField("job_type", job_type),
                                              IntField("count", static_cast<int64_t>(result.rows_affected)),
                                              DurationField("liveness_timeout", liveness_timeout)});
  }
  return result.rows_affected;
}

} // namespace jobq::worker
