#pragma once

#include <string>
#include <utility>
#include <vector>

namespace jobq::db::postgres {

/*
  Postgres spellings of internal/db/sql/sql_queries.hpp. Same predicates,
  $N placeholders, NULLS FIRST so sweep order matches SQLite.
*/

#define JOBQ_PG_JOB_COLUMNS \
  "seq,id,payload,job_type,status,attempts,max_attempts,run_at_ms,last_error,lock_at_ms,lock_by,done_at_ms"

inline const std::vector<std::pair<std::string, std::string>>& PreparedStatements() {
  static const std::vector<std::pair<std::string, std::string>> kStatements = {
      {"insert_job",
       "INSERT INTO jobs(id,payload,job_type,status,attempts,max_attempts,run_at_ms) "
       "VALUES($1,$2,$3,'Pending',0,$4,$5) RETURNING seq"},
      {"get_job", "SELECT " JOBQ_PG_JOB_COLUMNS " FROM jobs WHERE id=$1"},
      {"select_candidate",
       "SELECT " JOBQ_PG_JOB_COLUMNS " FROM jobs "
       "WHERE (status='Pending' OR (status='Failed' AND attempts<max_attempts)) "
       "AND lock_by IS NULL AND run_at_ms<=$2 AND job_type=$1 ORDER BY seq ASC LIMIT 1"},
      {"conditional_claim",
       "UPDATE jobs SET status='Running', lock_by=$2, lock_at_ms=$3 "
       "WHERE id=$1 AND lock_by IS NULL "
       "AND (status='Pending' OR (status='Failed' AND attempts<max_attempts AND run_at_ms<=$3))"},
      {"set_status_if_owner",
       "UPDATE jobs SET status=$3, done_at_ms=$4 WHERE id=$1 AND lock_by=$2 AND status='Running'"},
      {"release_if_owner",
       "UPDATE jobs SET status='Pending', lock_by=NULL, done_at_ms=NULL "
       "WHERE id=$1 AND lock_by=$2 AND status='Running'"},
      {"reschedule_job",
       "UPDATE jobs SET status='Failed', lock_by=NULL, lock_at_ms=NULL, done_at_ms=NULL, run_at_ms=$2 WHERE id=$1"},
      {"update_job_fields",
       "UPDATE jobs SET status=$2, attempts=$3, done_at_ms=$4, lock_by=$5, lock_at_ms=$6, last_error=$7 WHERE id=$1"},
      {"count_pending", "SELECT COUNT(*) FROM jobs WHERE status='Pending' AND job_type=$1"},
      {"list_jobs",
       "SELECT " JOBQ_PG_JOB_COLUMNS " FROM jobs WHERE status=$1 ORDER BY seq ASC LIMIT $2 OFFSET $3"},
      {"list_jobs_by_type",
       "SELECT " JOBQ_PG_JOB_COLUMNS " FROM jobs WHERE status=$1 AND job_type=$4 "
       "ORDER BY seq ASC LIMIT $2 OFFSET $3"},
      {"upsert_worker",
       "INSERT INTO workers(id,worker_type,storage_name,last_seen_ms) VALUES($1,$2,$3,$4) "
       "ON CONFLICT(id) DO UPDATE SET worker_type=EXCLUDED.worker_type, "
       "storage_name=EXCLUDED.storage_name, last_seen_ms=EXCLUDED.last_seen_ms"},
      {"get_worker", "SELECT id,worker_type,storage_name,last_seen_ms FROM workers WHERE id=$1"},
      {"requeue_failed",
       "UPDATE jobs SET status='Pending', done_at_ms=NULL, lock_by=NULL, lock_at_ms=NULL "
       "WHERE id IN (SELECT id FROM jobs WHERE status='Failed' AND attempts<max_attempts AND job_type=$1 "
       "ORDER BY lock_at_ms ASC NULLS FIRST, seq ASC LIMIT $2)"},
      {"requeue_orphaned",
       "UPDATE jobs SET status='Pending', done_at_ms=NULL, lock_by=NULL, lock_at_ms=NULL, last_error=$4 "
       "WHERE id IN (SELECT jobs.id FROM jobs INNER JOIN workers ON jobs.lock_by=workers.id "
       "WHERE jobs.status='Running' AND jobs.job_type=$1 AND workers.last_seen_ms<$3 "
       "ORDER BY jobs.lock_at_ms ASC NULLS FIRST, jobs.seq ASC LIMIT $2)"},
  };
  return kStatements;
}

} // namespace jobq::db::postgres
