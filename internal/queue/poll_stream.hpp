#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "claimer.hpp"

namespace jobq::queue {

// One poll result: a claimed job, nothing (both unset), or an error.
struct PollTick {
  std::optional<db::model::JobRecord> job;
  std::optional<std::string>          error;

  bool empty() const {
    return !job && !error;
  }
};

using TickSink = std::function<void(PollTick)>;

struct PollStreamOptions {
  std::string               worker_id;
  std::string               job_type;
  std::chrono::milliseconds poll_interval{100};
};

/*
  Background polling loop for one (worker, job_type).

  - First tick fires immediately, then every poll_interval on a fixed-rate
    schedule; a late tick fires at once and the schedule catches up.
  - Each tick calls Claimer::ClaimNext exactly once and hands the outcome
    to the sink on the stream thread. The stream keeps no backlog.
  - Claim failures become error ticks; the stream keeps going.
  - Cancel() stops before the next tick. A claim in progress completes and
    its tick is still delivered.
*/
class PollStream {
 public:
  PollStream(std::shared_ptr<Claimer> claimer, PollStreamOptions options, TickSink sink);
  ~PollStream();

  PollStream(const PollStream&)            = delete;
  PollStream& operator=(const PollStream&) = delete;

  void Start();
  void Cancel();

  bool Running() const {
    return running_;
  }

  uint64_t TickCount() const {
    return ticks_;
  }

 private:
  void Run();
  void Tick();

  std::shared_ptr<Claimer> claimer_;
  PollStreamOptions        options_;
  TickSink                 sink_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    cancelled_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> ticks_{0};
};

} // namespace jobq::queue
