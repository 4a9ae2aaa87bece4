#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "poll_stream.hpp"

namespace jobq::queue {

/*
  Thread-safe blocking buffer between a PollStream and its consumer.

  Sink() returns a TickSink that pushes into the buffer. Empty ticks are
  dropped unless keep_empty is set.
*/
class TickBuffer {
 public:
  explicit TickBuffer(bool keep_empty = false) : keep_empty_(keep_empty) {
  }

  void Push(PollTick tick);

  TickSink Sink();

  // blocking wait; nullopt after Shutdown() once drained
  std::optional<PollTick> Pop();

  // nullopt on timeout or after Shutdown() once drained
  std::optional<PollTick> PopFor(std::chrono::milliseconds timeout);

  void Shutdown();

  // Removes and returns every buffered tick.
  std::vector<PollTick> Drain();

  std::size_t Size();

 private:
  std::optional<PollTick> TakeLocked();

  bool                    keep_empty_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<PollTick>    queue_;
  bool                    shutdown_ = false;
};

} // namespace jobq::queue
