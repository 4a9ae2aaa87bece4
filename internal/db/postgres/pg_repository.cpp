#include "pg_repository.hpp"

#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"

namespace jobq::db::postgres {

using jobq::model::JobStatus;

namespace {

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::optional<int64_t> OptI64(const std::optional<uint64_t>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return static_cast<uint64_t>(f.as<int64_t>());
}

// Column order follows JOBQ_PG_JOB_COLUMNS.
model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.seq = static_cast<uint64_t>(row[0].as<int64_t>());
  r.id  = row[1].c_str();

  const auto bytes = row[2].as<std::basic_string<std::byte>>();
  r.payload.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());

  r.job_type = row[3].c_str();

  const std::string status = row[4].c_str();
  auto              parsed = jobq::model::ParseJobStatus(status);
  if (!parsed) {
    throw util::StoreError(ErrorCode::Corruption, "unknown job status '" + status + "' for job " + r.id);
  }
  r.status = *parsed;

  r.attempts     = row[5].as<int32_t>();
  r.max_attempts = row[6].as<int32_t>();
  r.run_at_ms    = static_cast<uint64_t>(row[7].as<int64_t>());
  r.last_error   = OptText(row[8]);
  r.lock_at_ms   = OptU64(row[9]);
  r.lock_by      = OptText(row[10]);
  r.done_at_ms   = OptU64(row[11]);
  return r;
}

// Reads surface backend failures as StoreError.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StoreError(ToErrorCode(e), e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  try {
    return std::make_unique<PgTransaction>(pool_);
  } catch (const pqxx::failure& e) {
    throw util::StoreError(ToErrorCode(e), e.what());
  }
}

void PgRepository::EnsureSchema() {
  auto tx = Begin();
  try {
    for (const auto& stmt : sql::PostgresSchema()) {
      TX(*tx).Work().exec(stmt);
    }
    tx->Commit();
  } catch (const pqxx::failure& e) {
    throw util::StoreError(ToErrorCode(e), e.what());
  }
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  return Result::Err(ToErrorCode(e), e.what());
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared1("insert_job", r.id, pqxx::binary_cast(r.payload), r.job_type,
                                           r.max_attempts, I64(r.run_at_ms));
    r.seq      = static_cast<uint64_t>(res[0].as<int64_t>());
    r.status   = JobStatus::kPending;
    r.attempts = 0;
    r.last_error.reset();
    r.lock_at_ms.reset();
    r.lock_by.reset();
    r.done_at_ms.reset();
    return Result::Ok(1);
  } catch (const pqxx::unique_violation&) {
    return Result::Err(ErrorCode::AlreadyExists, "job " + r.id + " already exists");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::JobRecord> {
    auto res = TX(t).Work().exec_prepared("get_job", id);
    if (res.empty()) return std::nullopt;
    return ReadJob(res[0]);
  });
}

std::optional<model::JobRecord>
PgRepository::SelectCandidate(Transaction& t, const std::string& job_type, uint64_t now_ms) {
  return Read([&]() -> std::optional<model::JobRecord> {
    auto res = TX(t).Work().exec_prepared("select_candidate", job_type, I64(now_ms));
    if (res.empty()) return std::nullopt;
    return ReadJob(res[0]);
  });
}

Result PgRepository::ConditionalClaim(Transaction& t, const std::string& id, const std::string& worker_id,
                                      uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("conditional_claim", id, worker_id, I64(now_ms));
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetStatusIfOwner(Transaction& t, const std::string& id, const std::string& worker_id,
                                      JobStatus status, uint64_t done_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("set_status_if_owner", id, worker_id,
                                          std::string(jobq::model::ToString(status)), I64(done_at_ms));
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ReleaseIfOwner(Transaction& t, const std::string& id, const std::string& worker_id) {
  try {
    auto res = TX(t).Work().exec_prepared("release_if_owner", id, worker_id);
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::Reschedule(Transaction& t, const std::string& id, uint64_t run_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("reschedule_job", id, I64(run_at_ms));
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateJobFields(Transaction& t, const model::JobFieldUpdate& u) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job_fields", u.id, std::string(jobq::model::ToString(u.status)),
                                          u.attempts, OptI64(u.done_at_ms), u.lock_by, OptI64(u.lock_at_ms),
                                          u.last_error);
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

int64_t PgRepository::CountPending(Transaction& t, const std::string& job_type) {
  return Read([&] {
    auto res = TX(t).Work().exec_prepared1("count_pending", job_type);
    return res[0].as<int64_t>();
  });
}

std::vector<model::JobRecord>
PgRepository::ListJobs(Transaction& t, const model::JobFilter& filter, const model::Pagination& page) {
  return Read([&] {
    const std::string status = std::string(jobq::model::ToString(filter.status));
    auto res = filter.job_type
                   ? TX(t).Work().exec_prepared("list_jobs_by_type", status, I64(page.limit), I64(page.offset),
                                                *filter.job_type)
                   : TX(t).Work().exec_prepared("list_jobs", status, I64(page.limit), I64(page.offset));

    std::vector<model::JobRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadJob(row));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result PgRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& w) {
  try {
    auto res = TX(t).Work().exec_prepared("upsert_worker", w.id, w.worker_type, w.storage_name, I64(w.last_seen_ms));
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkerRecord> PgRepository::GetWorker(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::WorkerRecord> {
    auto res = TX(t).Work().exec_prepared("get_worker", id);
    if (res.empty()) return std::nullopt;

    model::WorkerRecord w;
    w.id           = res[0][0].c_str();
    w.worker_type  = res[0][1].c_str();
    w.storage_name = res[0][2].c_str();
    w.last_seen_ms = static_cast<uint64_t>(res[0][3].as<int64_t>());
    return w;
  });
}

// ------------------------------------------------------------------
// Sweeps
// ------------------------------------------------------------------

Result PgRepository::RequeueFailed(Transaction& t, const std::string& job_type, uint64_t limit) {
  try {
    auto res = TX(t).Work().exec_prepared("requeue_failed", job_type, I64(limit));
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::RequeueOrphaned(Transaction& t, const std::string& job_type, uint64_t limit, uint64_t cutoff_ms,
                                     const std::string& marker) {
  try {
    auto res = TX(t).Work().exec_prepared("requeue_orphaned", job_type, I64(limit), I64(cutoff_ms), marker);
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace jobq::db::postgres
