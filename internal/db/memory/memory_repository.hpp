#pragma once

#include <chrono>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace jobq::db::memory {

class MemoryTransaction;

/*
  Process-local backend for tests and single-process deployments.

  A transaction holds the writer lock from Begin() until commit or
  rollback, so claims serialize exactly like BEGIN IMMEDIATE on SQLite.
  Begin() throws util::StoreError{Busy} after busy_timeout.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));

  std::unique_ptr<Transaction> Begin() override;
  std::string_view StorageName() const override { return "memory"; }

  Result InsertJob(Transaction&, model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::optional<model::JobRecord> SelectCandidate(Transaction&, const std::string& job_type, uint64_t now_ms) override;
  Result ConditionalClaim(Transaction&, const std::string& id, const std::string& worker_id, uint64_t now_ms) override;
  Result SetStatusIfOwner(Transaction&, const std::string& id, const std::string& worker_id,
                          jobq::model::JobStatus status, uint64_t done_at_ms) override;
  Result ReleaseIfOwner(Transaction&, const std::string& id, const std::string& worker_id) override;
  Result Reschedule(Transaction&, const std::string& id, uint64_t run_at_ms) override;
  Result UpdateJobFields(Transaction&, const model::JobFieldUpdate&) override;
  int64_t CountPending(Transaction&, const std::string& job_type) override;
  std::vector<model::JobRecord> ListJobs(Transaction&, const model::JobFilter&, const model::Pagination&) override;

  Result UpsertWorker(Transaction&, const model::WorkerRecord&) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string&) override;

  Result RequeueFailed(Transaction&, const std::string& job_type, uint64_t limit) override;
  Result RequeueOrphaned(Transaction&, const std::string& job_type, uint64_t limit, uint64_t cutoff_ms,
                         const std::string& marker) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::JobRecord>    jobs;
    std::unordered_map<std::string, model::WorkerRecord> workers;
    uint64_t next_seq = 1;
  };

  std::timed_mutex          writer_mutex_;
  std::chrono::milliseconds busy_timeout_;
  State                     committed_;
};

}
