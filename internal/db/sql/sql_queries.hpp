#pragma once

namespace jobq::db::sql {

/*
  Canonical SQL for the SQLite backend (numbered ?N parameters).

  The Postgres backend keeps the same predicates with $N placeholders in
  pg_queries.hpp; change both together.

  IMPORTANT:
  The candidate predicate groups the status disjunction explicitly so the
  run_at and job_type filters apply to Pending and Failed rows alike. It
  also skips rows still carrying a lock_by, which CONDITIONAL_CLAIM would
  refuse anyway.

  Owner-guarded writes only match Running rows; a finalized job keeps its
  lock_by but can no longer be acked, killed or retried.
*/

#define JOBQ_JOB_COLUMNS \
  "seq,id,payload,job_type,status,attempts,max_attempts,run_at_ms,last_error,lock_at_ms,lock_by,done_at_ms"

static constexpr const char* INSERT_JOB =
    "INSERT INTO jobs(id,payload,job_type,status,attempts,max_attempts,run_at_ms)"
    " VALUES(?1,?2,?3,'Pending',0,?4,?5);";

static constexpr const char* SELECT_JOB =
    "SELECT " JOBQ_JOB_COLUMNS " FROM jobs WHERE id=?1;";

static constexpr const char* SELECT_CANDIDATE =
    "SELECT " JOBQ_JOB_COLUMNS " FROM jobs"
    " WHERE (status='Pending' OR (status='Failed' AND attempts<max_attempts))"
    " AND lock_by IS NULL AND run_at_ms<=?2 AND job_type=?1"
    " ORDER BY seq ASC LIMIT 1;";

static constexpr const char* CONDITIONAL_CLAIM =
    "UPDATE jobs SET status='Running', lock_by=?2, lock_at_ms=?3"
    " WHERE id=?1 AND lock_by IS NULL"
    " AND (status='Pending' OR (status='Failed' AND attempts<max_attempts AND run_at_ms<=?3));";

static constexpr const char* SET_STATUS_IF_OWNER =
    "UPDATE jobs SET status=?3, done_at_ms=?4 WHERE id=?1 AND lock_by=?2 AND status='Running';";

static constexpr const char* RELEASE_IF_OWNER =
    "UPDATE jobs SET status='Pending', lock_by=NULL, done_at_ms=NULL"
    " WHERE id=?1 AND lock_by=?2 AND status='Running';";

static constexpr const char* RESCHEDULE_JOB =
    "UPDATE jobs SET status='Failed', lock_by=NULL, lock_at_ms=NULL, done_at_ms=NULL, run_at_ms=?2"
    " WHERE id=?1;";

static constexpr const char* UPDATE_JOB_FIELDS =
    "UPDATE jobs SET status=?2, attempts=?3, done_at_ms=?4, lock_by=?5, lock_at_ms=?6, last_error=?7"
    " WHERE id=?1;";

static constexpr const char* COUNT_PENDING =
    "SELECT COUNT(*) FROM jobs WHERE status='Pending' AND job_type=?1;";

static constexpr const char* LIST_JOBS =
    "SELECT " JOBQ_JOB_COLUMNS " FROM jobs WHERE status=?1"
    " ORDER BY seq ASC LIMIT ?2 OFFSET ?3;";

static constexpr const char* LIST_JOBS_BY_TYPE =
    "SELECT " JOBQ_JOB_COLUMNS " FROM jobs WHERE status=?1 AND job_type=?4"
    " ORDER BY seq ASC LIMIT ?2 OFFSET ?3;";

// workers

static constexpr const char* UPSERT_WORKER =
    "INSERT INTO workers(id,worker_type,storage_name,last_seen_ms) VALUES(?1,?2,?3,?4)"
    " ON CONFLICT(id) DO UPDATE SET"
    " worker_type=excluded.worker_type,"
    " storage_name=excluded.storage_name,"
    " last_seen_ms=excluded.last_seen_ms;";

static constexpr const char* SELECT_WORKER =
    "SELECT id,worker_type,storage_name,last_seen_ms FROM workers WHERE id=?1;";

// sweeps

static constexpr const char* REQUEUE_FAILED =
    "UPDATE jobs SET status='Pending', done_at_ms=NULL, lock_by=NULL, lock_at_ms=NULL"
    " WHERE id IN (SELECT id FROM jobs"
    " WHERE status='Failed' AND attempts<max_attempts AND job_type=?1"
    " ORDER BY lock_at_ms ASC, seq ASC LIMIT ?2);";

static constexpr const char* REQUEUE_ORPHANED =
    "UPDATE jobs SET status='Pending', done_at_ms=NULL, lock_by=NULL, lock_at_ms=NULL, last_error=?4"
    " WHERE id IN (SELECT jobs.id FROM jobs INNER JOIN workers ON jobs.lock_by=workers.id"
    " WHERE jobs.status='Running' AND jobs.job_type=?1 AND workers.last_seen_ms<?3"
    " ORDER BY jobs.lock_at_ms ASC, jobs.seq ASC LIMIT ?2);";

}
