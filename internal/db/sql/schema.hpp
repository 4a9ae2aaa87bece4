#pragma once

#include <string>
#include <vector>

namespace jobq::db::sql {

/*
  Bootstrap DDL. Idempotent (IF NOT EXISTS) so every process may run it on
  startup.

  Index set: jobs(id) via UNIQUE, jobs(status), jobs(lock_by), jobs(job_type),
  workers(id) via PRIMARY KEY, workers(worker_type), workers(last_seen_ms).
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS jobs (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, payload BLOB NOT NULL, job_type TEXT NOT NULL, status TEXT NOT NULL DEFAULT 'Pending', attempts INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL DEFAULT 25, run_at_ms INTEGER NOT NULL, last_error TEXT, lock_at_ms INTEGER, lock_by TEXT, done_at_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS jobs_status_idx ON jobs(status);",
      "CREATE INDEX IF NOT EXISTS jobs_lock_by_idx ON jobs(lock_by);",
      "CREATE INDEX IF NOT EXISTS jobs_job_type_idx ON jobs(job_type);",
      "CREATE TABLE IF NOT EXISTS workers (id TEXT PRIMARY KEY, worker_type TEXT NOT NULL, storage_name TEXT NOT NULL, last_seen_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS workers_worker_type_idx ON workers(worker_type);",
      "CREATE INDEX IF NOT EXISTS workers_last_seen_idx ON workers(last_seen_ms);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS jobs (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, payload BYTEA NOT NULL, job_type TEXT NOT NULL, status TEXT NOT NULL DEFAULT 'Pending', attempts INTEGER NOT NULL DEFAULT 0, max_attempts INTEGER NOT NULL DEFAULT 25, run_at_ms BIGINT NOT NULL, last_error TEXT, lock_at_ms BIGINT, lock_by TEXT, done_at_ms BIGINT);",
      "CREATE INDEX IF NOT EXISTS jobs_status_idx ON jobs(status);",
      "CREATE INDEX IF NOT EXISTS jobs_lock_by_idx ON jobs(lock_by);",
      "CREATE INDEX IF NOT EXISTS jobs_job_type_idx ON jobs(job_type);",
      "CREATE TABLE IF NOT EXISTS workers (id TEXT PRIMARY KEY, worker_type TEXT NOT NULL, storage_name TEXT NOT NULL, last_seen_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS workers_worker_type_idx ON workers(worker_type);",
      "CREATE INDEX IF NOT EXISTS workers_last_seen_idx ON workers(last_seen_ms);"};
  return kSchema;
}

}
