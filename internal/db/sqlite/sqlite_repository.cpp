#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace jobq::db::sqlite {

using jobq::db::ErrorCode;
using jobq::db::Result;
using jobq::model::JobStatus;

namespace {

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }
    sqlite3_stmt* get() const { return st_; }

    // Throws StoreError when preparation failed; used by readers.
    sqlite3_stmt* checked() const {
        if (!ok()) throw util::StoreError(ToErrorCode(rc_), sqlite3_errmsg(db_));
        return st_;
    }

private:
    sqlite3*      db_;
    sqlite3_stmt* st_ = nullptr;
    int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) BindText(st, idx, *s);
    else sqlite3_bind_null(st, idx);
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
    if (v) BindU64(st, idx, *v);
    else sqlite3_bind_null(st, idx);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(st, col)) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    return b ? std::string(static_cast<const char*>(b), sqlite3_column_bytes(st, col)) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool IsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    return ColText(st, col);
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
    if (IsNull(st, col)) return std::nullopt;
    return ColU64(st, col);
}

// Column order follows JOBQ_JOB_COLUMNS.
model::JobRecord ReadJob(sqlite3_stmt* st) {
    model::JobRecord r;
    r.seq          = ColU64(st, 0);
    r.id           = ColText(st, 1);
    r.payload      = ColBlob(st, 2);
    r.job_type     = ColText(st, 3);

    const auto status = ColText(st, 4);
    auto parsed = jobq::model::ParseJobStatus(status);
    if (!parsed) {
        throw util::StoreError(ErrorCode::Corruption, "unknown job status '" + status + "' for job " + r.id);
    }
    r.status       = *parsed;

    r.attempts     = sqlite3_column_int(st, 5);
    r.max_attempts = sqlite3_column_int(st, 6);
    r.run_at_ms    = ColU64(st, 7);
    r.last_error   = ColOptText(st, 8);
    r.lock_at_ms   = ColOptU64(st, 9);
    r.lock_by      = ColOptText(st, 10);
    r.done_at_ms   = ColOptU64(st, 11);
    return r;
}

// Steps a single-row SELECT; throws on anything but ROW/DONE.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw util::StoreError(ToErrorCode(rc), sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

void SqliteRepository::EnsureSchema() {
    SqliteTransaction tx(db_);
    for (const auto& stmt : sql::SqliteSchema()) {
        db_->Exec(stmt);
    }
    tx.Commit();
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));

    return Result::Err(ToErrorCode(rc), sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, model::JobRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_JOB);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, r.id);
    BindBlob(st.get(), 2, r.payload);
    BindText(st.get(), 3, r.job_type);
    BindI32(st.get(), 4, r.max_attempts);
    BindU64(st.get(), 5, r.run_at_ms);

    int rc = sqlite3_step(st.get());
    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "job " + r.id + " already exists");

    auto result = Translate(db, rc);
    if (result) {
        r.seq        = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
        r.status     = JobStatus::kPending;
        r.attempts   = 0;
        r.last_error.reset();
        r.lock_at_ms.reset();
        r.lock_by.reset();
        r.done_at_ms.reset();
    }
    return result;
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_JOB);
    BindText(st.checked(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadJob(st.get());
}

std::optional<model::JobRecord>
SqliteRepository::SelectCandidate(Transaction& t, const std::string& job_type, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_CANDIDATE);
    BindText(st.checked(), 1, job_type);
    BindU64(st.get(), 2, now_ms);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadJob(st.get());
}

Result SqliteRepository::ConditionalClaim(Transaction& t, const std::string& id, const std::string& worker_id,
                                          uint64_t now_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::CONDITIONAL_CLAIM);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);
    BindText(st.get(), 2, worker_id);
    BindU64(st.get(), 3, now_ms);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::SetStatusIfOwner(Transaction& t, const std::string& id, const std::string& worker_id,
                                          JobStatus status, uint64_t done_at_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SET_STATUS_IF_OWNER);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);
    BindText(st.get(), 2, worker_id);
    BindText(st.get(), 3, std::string(jobq::model::ToString(status)));
    BindU64(st.get(), 4, done_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::ReleaseIfOwner(Transaction& t, const std::string& id, const std::string& worker_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::RELEASE_IF_OWNER);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);
    BindText(st.get(), 2, worker_id);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::Reschedule(Transaction& t, const std::string& id, uint64_t run_at_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::RESCHEDULE_JOB);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, id);
    BindU64(st.get(), 2, run_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateJobFields(Transaction& t, const model::JobFieldUpdate& u) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_JOB_FIELDS);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, u.id);
    BindText(st.get(), 2, std::string(jobq::model::ToString(u.status)));
    BindI32(st.get(), 3, u.attempts);
    BindOptU64(st.get(), 4, u.done_at_ms);
    BindOptText(st.get(), 5, u.lock_by);
    BindOptU64(st.get(), 6, u.lock_at_ms);
    BindOptText(st.get(), 7, u.last_error);

    return Translate(db, sqlite3_step(st.get()));
}

int64_t SqliteRepository::CountPending(Transaction& t, const std::string& job_type) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::COUNT_PENDING);
    BindText(st.checked(), 1, job_type);

    if (!StepRow(db, st.get())) return 0;
    return sqlite3_column_int64(st.get(), 0);
}

std::vector<model::JobRecord>
SqliteRepository::ListJobs(Transaction& t, const model::JobFilter& filter, const model::Pagination& page) {
    auto* db = TX(t).Handle();

    Statement st(db, filter.job_type ? sql::LIST_JOBS_BY_TYPE : sql::LIST_JOBS);
    BindText(st.checked(), 1, std::string(jobq::model::ToString(filter.status)));
    BindU64(st.get(), 2, page.limit);
    BindU64(st.get(), 3, page.offset);
    if (filter.job_type) BindText(st.get(), 4, *filter.job_type);

    std::vector<model::JobRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadJob(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& w) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_WORKER);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, w.id);
    BindText(st.get(), 2, w.worker_type);
    BindText(st.get(), 3, w.storage_name);
    BindU64(st.get(), 4, w.last_seen_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::WorkerRecord> SqliteRepository::GetWorker(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_WORKER);
    BindText(st.checked(), 1, id);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::WorkerRecord w;
    w.id           = ColText(st.get(), 0);
    w.worker_type  = ColText(st.get(), 1);
    w.storage_name = ColText(st.get(), 2);
    w.last_seen_ms = ColU64(st.get(), 3);
    return w;
}

// ------------------------------------------------------------------
// Sweeps
// ------------------------------------------------------------------

Result SqliteRepository::RequeueFailed(Transaction& t, const std::string& job_type, uint64_t limit) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::REQUEUE_FAILED);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, job_type);
    BindU64(st.get(), 2, limit);

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::RequeueOrphaned(Transaction& t, const std::string& job_type, uint64_t limit,
                                         uint64_t cutoff_ms, const std::string& marker) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::REQUEUE_ORPHANED);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.get(), 1, job_type);
    BindU64(st.get(), 2, limit);
    BindU64(st.get(), 3, cutoff_ms);
    BindText(st.get(), 4, marker);

    return Translate(db, sqlite3_step(st.get()));
}

} // namespace jobq::db::sqlite
