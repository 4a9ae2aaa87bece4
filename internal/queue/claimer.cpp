#include "claimer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobq::queue {

using jobq::observability::StringField;

Claimer::Claimer(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

std::optional<db::model::JobRecord> Claimer::ClaimNext(const std::string& worker_id, const std::string& job_type) {
  const uint64_t now_ms = util::ToUnixMillis(now_());

  std::optional<db::model::JobRecord> candidate;
  {
    auto tx   = repository_->Begin();
    candidate = repository_->SelectCandidate(*tx, job_type, now_ms);
    tx->Commit();
  }
  if (!candidate) {
    return std::nullopt;
  }

  auto tx     = repository_->Begin();
  auto result = repository_->ConditionalClaim(*tx, candidate->id, worker_id, now_ms);
  util::ThrowIfError(result, "claim job " + candidate->id);

  if (result.rows_affected == 0) {
    tx->Commit();
    JOBQ_LOG_DEBUG("claim lost", {StringField("job_id", candidate->id), StringField("worker_id", worker_id)});
    return std::nullopt;
  }

  auto claimed = repository_->GetJob(*tx, candidate->id);
  tx->Commit();

  if (claimed) {
    JOBQ_LOG_DEBUG("job claimed", {StringField("job_id", claimed->id), StringField("job_type", job_type),
                                   StringField("worker_id", worker_id)});
  }
  return claimed;
}

} // namespace jobq::queue
