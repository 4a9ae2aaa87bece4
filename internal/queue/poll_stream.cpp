#include "poll_stream.hpp"

#include "internal/observability/logging.hpp"

namespace jobq::queue {

using jobq::observability::StringField;

PollStream::PollStream(std::shared_ptr<Claimer> claimer, PollStreamOptions options, TickSink sink)
    : claimer_(std::move(claimer)), options_(std::move(options)), sink_(std::move(sink)) {
  if (options_.poll_interval <= std::chrono::milliseconds::zero()) {
    options_.poll_interval = std::chrono::milliseconds(1);
  }
}

PollStream::~PollStream() {
  Cancel();
}

void PollStream::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&PollStream::Run, this);
}

void PollStream::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void PollStream::Run() {
  JOBQ_LOG_INFO("poll stream started",
                {StringField("worker_id", options_.worker_id), StringField("job_type", options_.job_type),
                 jobq::observability::DurationField("poll_interval", options_.poll_interval)});

  auto next_tick = std::chrono::steady_clock::now();
  for (;;) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_until(lock, next_tick, [this] { return cancelled_; })) {
        break;
      }
    }

    Tick();
    next_tick += options_.poll_interval;
  }

  running_ = false;
  JOBQ_LOG_INFO("poll stream stopped",
                {StringField("worker_id", options_.worker_id), StringField("job_type", options_.job_type)});
}

void PollStream::Tick() {
  PollTick tick;
  try {
    tick.job = claimer_->ClaimNext(options_.worker_id, options_.job_type);
  } catch (const std::exception& e) {
    JOBQ_LOG_WARN("poll tick failed", {StringField("worker_id", options_.worker_id),
                                       StringField("job_type", options_.job_type), StringField("error", e.what())});
    tick.error = e.what();
  }
  ++ticks_;
  sink_(std::move(tick));
}

} // namespace jobq::queue
