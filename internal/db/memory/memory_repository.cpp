#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace jobq::db::memory {

using jobq::model::JobStatus;

namespace {

bool IsCandidate(const model::JobRecord& r, const std::string& job_type, uint64_t now_ms) {
  const bool eligible =
      r.status == JobStatus::kPending || (r.status == JobStatus::kFailed && r.attempts < r.max_attempts);
  return eligible && !r.lock_by.has_value() && r.run_at_ms <= now_ms && r.job_type == job_type;
}

// Owner-guarded writes apply only while the owner still holds a Running job.
bool HeldBy(const model::JobRecord& r, const std::string& worker_id, JobStatus to) {
  return r.lock_by == worker_id && r.status == JobStatus::kRunning && jobq::model::CanTransition(r.status, to);
}

// Mirrors ORDER BY lock_at ASC, seq ASC with NULL lock_at first.
bool LockAtBefore(const model::JobRecord* a, const model::JobRecord* b) {
  const uint64_t la = a->lock_at_ms.value_or(0);
  const uint64_t lb = b->lock_at_ms.value_or(0);
  if (a->lock_at_ms.has_value() != b->lock_at_ms.has_value()) return !a->lock_at_ms.has_value();
  if (la != lb) return la < lb;
  return a->seq < b->seq;
}

void ClearLock(model::JobRecord& r) {
  r.status = JobStatus::kPending;
  r.done_at_ms.reset();
  r.lock_by.reset();
  r.lock_at_ms.reset();
}

} // namespace

MemoryRepository::MemoryRepository(std::chrono::milliseconds busy_timeout) : busy_timeout_(busy_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job " + r.id + " already exists");

  r.seq      = s.next_seq++;
  r.status   = JobStatus::kPending;
  r.attempts = 0;
  r.last_error.reset();
  r.lock_at_ms.reset();
  r.lock_by.reset();
  r.done_at_ms.reset();
  s.jobs[r.id] = r;
  return Result::Ok(1);
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::JobRecord>
MemoryRepository::SelectCandidate(Transaction& t, const std::string& job_type, uint64_t now_ms) {
  const auto&             s    = TX(t).View();
  const model::JobRecord* best = nullptr;
  for (const auto& [_, record] : s.jobs) {
    if (!IsCandidate(record, job_type, now_ms)) continue;
    if (!best || record.seq < best->seq) best = &record;
  }
  if (!best) return std::nullopt;
  return *best;
}

Result MemoryRepository::ConditionalClaim(Transaction& t, const std::string& id, const std::string& worker_id,
                                          uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(id);
  if (it == s.jobs.end()) return Result::Ok(0);

  auto&      r         = it->second;
  const bool claimable = !r.lock_by.has_value() &&
                         (r.status == JobStatus::kPending ||
                          (r.status == JobStatus::kFailed && r.attempts < r.max_attempts && r.run_at_ms <= now_ms));
  if (!claimable) return Result::Ok(0);

  r.status     = JobStatus::kRunning;
  r.lock_by    = worker_id;
  r.lock_at_ms = now_ms;
  return Result::Ok(1);
}

Result MemoryRepository::SetStatusIfOwner(Transaction& t, const std::string& id, const std::string& worker_id,
                                          JobStatus status, uint64_t done_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(id);
  if (it == s.jobs.end() || !HeldBy(it->second, worker_id, status)) return Result::Ok(0);

  it->second.status     = status;
  it->second.done_at_ms = done_at_ms;
  return Result::Ok(1);
}

Result MemoryRepository::ReleaseIfOwner(Transaction& t, const std::string& id, const std::string& worker_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(id);
  if (it == s.jobs.end() || !HeldBy(it->second, worker_id, JobStatus::kPending)) return Result::Ok(0);

  it->second.status = JobStatus::kPending;
  it->second.lock_by.reset();
  it->second.done_at_ms.reset();
  return Result::Ok(1);
}

Result MemoryRepository::Reschedule(Transaction& t, const std::string& id, uint64_t run_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(id);
  if (it == s.jobs.end()) return Result::Ok(0);

  auto& r  = it->second;
  r.status = JobStatus::kFailed;
  r.lock_by.reset();
  r.lock_at_ms.reset();
  r.done_at_ms.reset();
  r.run_at_ms = run_at_ms;
  return Result::Ok(1);
}

Result MemoryRepository::UpdateJobFields(Transaction& t, const model::JobFieldUpdate& u) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(u.id);
  if (it == s.jobs.end()) return Result::Ok(0);

  auto& r      = it->second;
  r.status     = u.status;
  r.attempts   = u.attempts;
  r.done_at_ms = u.done_at_ms;
  r.lock_by    = u.lock_by;
  r.lock_at_ms = u.lock_at_ms;
  r.last_error = u.last_error;
  return Result::Ok(1);
}

int64_t MemoryRepository::CountPending(Transaction& t, const std::string& job_type) {
  const auto& s = TX(t).View();
  return std::count_if(s.jobs.begin(), s.jobs.end(), [&](const auto& entry) {
    return entry.second.status == JobStatus::kPending && entry.second.job_type == job_type;
  });
}

std::vector<model::JobRecord>
MemoryRepository::ListJobs(Transaction& t, const model::JobFilter& filter, const model::Pagination& page) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> matched;
  for (const auto& [_, record] : s.jobs) {
    if (record.status != filter.status) continue;
    if (filter.job_type && record.job_type != *filter.job_type) continue;
    matched.push_back(record);
  }
  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) { return a.seq < b.seq; });

  if (page.offset >= matched.size()) return {};
  const auto first = matched.begin() + static_cast<std::ptrdiff_t>(page.offset);
  const auto last  = matched.begin() + static_cast<std::ptrdiff_t>(std::min<uint64_t>(matched.size(), page.offset + page.limit));
  return std::vector<model::JobRecord>(first, last);
}

Result MemoryRepository::UpsertWorker(Transaction& t, const model::WorkerRecord& w) {
  TX(t).Mutable().workers[w.id] = w;
  return Result::Ok(1);
}

std::optional<model::WorkerRecord> MemoryRepository::GetWorker(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.workers.find(id);
  if (it == s.workers.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::RequeueFailed(Transaction& t, const std::string& job_type, uint64_t limit) {
  auto&                          s = TX(t).Mutable();
  std::vector<model::JobRecord*> selected;
  for (auto& [_, record] : s.jobs) {
    if (record.status == JobStatus::kFailed && record.attempts < record.max_attempts && record.job_type == job_type) {
      selected.push_back(&record);
    }
  }
  std::sort(selected.begin(), selected.end(), LockAtBefore);
  if (selected.size() > limit) selected.resize(limit);

  for (auto* record : selected) ClearLock(*record);
  return Result::Ok(selected.size());
}

Result MemoryRepository::RequeueOrphaned(Transaction& t, const std::string& job_type, uint64_t limit,
                                         uint64_t cutoff_ms, const std::string& marker) {
  auto&                          s = TX(t).Mutable();
  std::vector<model::JobRecord*> selected;
  for (auto& [_, record] : s.jobs) {
    if (record.status != JobStatus::kRunning || record.job_type != job_type || !record.lock_by) continue;
    auto owner = s.workers.find(*record.lock_by);
    if (owner == s.workers.end() || owner->second.last_seen_ms >= cutoff_ms) continue;
    selected.push_back(&record);
  }
  std::sort(selected.begin(), selected.end(), LockAtBefore);
  if (selected.size() > limit) selected.resize(limit);

  for (auto* record : selected) {
    ClearLock(*record);
    record->last_error = marker;
  }
  return Result::Ok(selected.size());
}

} // namespace jobq::db::memory
