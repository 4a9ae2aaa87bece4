#include <atomic>
#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <latch>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/queue/job_queue.hpp"

namespace {

constexpr int kThreads = 8;

using RepositoryFactory = std::function<std::shared_ptr<jobq::db::Repository>()>;

std::filesystem::path FreshDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "jobq_claim_concurrency_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

std::shared_ptr<jobq::db::sqlite::SqliteRepository> OpenSqlite(const std::filesystem::path& path) {
  auto db = std::make_shared<jobq::db::sqlite::SqliteDB>(jobq::db::sqlite::SqliteOptions{.path = path.string()});
  auto repository = std::make_shared<jobq::db::sqlite::SqliteRepository>(db);
  repository->EnsureSchema();
  return repository;
}

// All threads race for one job; exactly one wins.
void RunSingleJobRace(const std::string& label, const std::shared_ptr<jobq::db::Repository>& seed,
                      const RepositoryFactory& per_thread) {
  jobq::queue::JobQueue producer(seed);
  const auto            job = producer.Enqueue("race", "only");

  std::latch        start(kThreads);
  std::atomic<int>  winners{0};
  std::string       winner_id;
  std::mutex        mutex;
  std::vector<std::thread> threads;

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      jobq::queue::JobQueue queue(per_thread());
      start.arrive_and_wait();
      const auto claimed = queue.claimer()->ClaimNext("w" + std::to_string(i), "race");
      if (claimed) {
        winners.fetch_add(1);
        std::lock_guard lock(mutex);
        winner_id = claimed->lock_by.value_or("");
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(winners.load() == 1 && "exactly one claimant must win");
  const auto stored = producer.FetchById(job.id);
  assert(stored->lock_by == winner_id);
  std::cout << "  " << label << " single-job race ok\n";
}

// Threads drain a backlog; every job is claimed exactly once.
void RunDrain(const std::string& label, const std::shared_ptr<jobq::db::Repository>& seed,
              const RepositoryFactory& per_thread) {
  constexpr int kJobs = 64;

  jobq::queue::JobQueue producer(seed);
  for (int i = 0; i < kJobs; ++i) {
    (void)producer.Enqueue("drain", std::to_string(i));
  }

  std::latch               start(kThreads);
  std::mutex               mutex;
  std::multiset<std::string> claimed_ids;
  std::vector<std::thread> threads;

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      jobq::queue::JobQueue queue(per_thread());
      const auto            worker = "w" + std::to_string(i);
      start.arrive_and_wait();
      while (queue.Len("drain") > 0) {
        auto job = queue.claimer()->ClaimNext(worker, "drain");
        if (!job) continue;
        assert(queue.Ack(worker, job->id) == jobq::queue::LifecycleOutcome::kApplied);
        std::lock_guard lock(mutex);
        claimed_ids.insert(job->id);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(claimed_ids.size() == kJobs);
  assert(std::set<std::string>(claimed_ids.begin(), claimed_ids.end()).size() == kJobs);
  assert(producer.List(jobq::model::JobStatus::kDone, 1).size() == 10);
  std::cout << "  " << label << " drain ok\n";
}

void TestMemoryBackend() {
  auto repository = std::make_shared<jobq::db::memory::MemoryRepository>();
  auto shared     = [repository] { return repository; };
  RunSingleJobRace("memory", repository, shared);
  RunDrain("memory", repository, shared);
}

void TestSqliteSharedConnection() {
  auto repository = OpenSqlite(FreshDbPath("shared"));
  auto shared     = [repository]() -> std::shared_ptr<jobq::db::Repository> { return repository; };
  RunSingleJobRace("sqlite shared connection", repository, shared);
  RunDrain("sqlite shared connection", repository, shared);
}

void TestSqliteSeparateConnections() {
  const auto path       = FreshDbPath("separate");
  auto       repository = OpenSqlite(path);
  auto per_thread = [path]() -> std::shared_ptr<jobq::db::Repository> { return OpenSqlite(path); };
  RunSingleJobRace("sqlite separate connections", repository, per_thread);
  RunDrain("sqlite separate connections", repository, per_thread);
}

} // namespace

int main() {
  TestMemoryBackend();
  TestSqliteSharedConnection();
  TestSqliteSeparateConnections();

  std::cout << "jobq_unit_claim_concurrency: pass\n";
  return 0;
}
