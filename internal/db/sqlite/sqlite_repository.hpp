#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace jobq::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::string_view StorageName() const override { return "sqlite"; }

  // Runs the idempotent schema bootstrap in its own transaction.
  void EnsureSchema();

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
