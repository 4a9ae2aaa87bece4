#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace jobq::db {

/*
  Repository abstraction over the jobs and workers tables.

  CRITICAL GUARANTEES:

  - All operations run inside a Transaction
  - Reads inside a transaction see its writes
  - ConditionalClaim is a single guarded UPDATE; rows_affected == 1 means
    the caller now owns the job, 0 means another worker won or the row
    moved on. Claim exclusivity depends on nothing else.
  - Owner-guarded updates report 0 rows when lock_by no longer matches

  Reads throw util::StoreError on backend failure. Writes return Result.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Diagnostic label written into workers.storage_name.
  virtual std::string_view StorageName() const = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  // Assigns record.seq on success.
  virtual Result InsertJob(Transaction&, model::JobRecord& record) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  // Earliest-created job of job_type that is Pending, or Failed with
  // attempts < max_attempts, and due at now_ms.
  virtual std::optional<model::JobRecord> SelectCandidate(Transaction&, const std::string& job_type, uint64_t now_ms) = 0;

  virtual Result ConditionalClaim(Transaction&, const std::string& id, const std::string& worker_id, uint64_t now_ms) = 0;

  // Ack / kill. Guarded by lock_by = worker_id.
  virtual Result SetStatusIfOwner(Transaction&, const std::string& id, const std::string& worker_id,
                                  jobq::model::JobStatus status, uint64_t done_at_ms) = 0;

  // Retry. Pending, lock_by/done_at cleared. Guarded by lock_by = worker_id.
  virtual Result ReleaseIfOwner(Transaction&, const std::string& id, const std::string& worker_id) = 0;

  virtual Result Reschedule(Transaction&, const std::string& id, uint64_t run_at_ms) = 0;

  virtual Result UpdateJobFields(Transaction&, const model::JobFieldUpdate& update) = 0;

  virtual int64_t CountPending(Transaction&, const std::string& job_type) = 0;

  virtual std::vector<model::JobRecord> ListJobs(Transaction&, const model::JobFilter& filter,
                                                 const model::Pagination& pagination) = 0;

  // ---------------------------------------------------------------------
  // Workers / sweeps
  // ---------------------------------------------------------------------

  virtual Result UpsertWorker(Transaction&, const model::WorkerRecord& record) = 0;

  virtual std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& id) = 0;

  // Failed + attempts < max_attempts -> Pending, oldest lock_at first.
  virtual Result RequeueFailed(Transaction&, const std::string& job_type, uint64_t limit) = 0;

  // Running jobs whose owner's last_seen_ms < cutoff_ms -> Pending with
  // last_error = marker, oldest lock_at first.
  virtual Result RequeueOrphaned(Transaction&, const std::string& job_type, uint64_t limit, uint64_t cutoff_ms,
                                 const std::string& marker) = 0;
};

} // namespace jobq::db
