#include "tick_buffer.hpp"

#include <iterator>

namespace jobq::queue {

void TickBuffer::Push(PollTick tick) {
  if (tick.empty() && !keep_empty_) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push_back(std::move(tick));
  }
  cv_.notify_one();
}

TickSink TickBuffer::Sink() {
  return [this](PollTick tick) { Push(std::move(tick)); };
}

std::optional<PollTick> TickBuffer::Pop() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
  return TakeLocked();
}

std::optional<PollTick> TickBuffer::PopFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return shutdown_ || !queue_.empty(); });
  return TakeLocked();
}

void TickBuffer::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::vector<PollTick> TickBuffer::Drain() {
  std::lock_guard       lock(mutex_);
  std::vector<PollTick> ticks(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  return ticks;
}

std::size_t TickBuffer::Size() {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::optional<PollTick> TickBuffer::TakeLocked() {
  if (queue_.empty()) return std::nullopt;

  PollTick tick = std::move(queue_.front());
  queue_.pop_front();
  return tick;
}

} // namespace jobq::queue
