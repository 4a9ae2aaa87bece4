#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace jobq::queue {

/*
  Two-step claim:

    1. SelectCandidate: earliest eligible job of the type (advisory, may race)
    2. ConditionalClaim: guarded UPDATE; exactly one claimant sees 1 row

  Losing the race returns nullopt. ClaimNext never retries within a call.
*/
class Claimer {
 public:
  Claimer(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  // Returns the job re-read after the claim (Running, lock_by = worker_id).
  // Throws util::StoreError.
  std::optional<db::model::JobRecord> ClaimNext(const std::string& worker_id, const std::string& job_type);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace jobq::queue
