#pragma once

#include <chrono>
#include <mutex>

#include "internal/util/time.hpp"

namespace jobq::testing {

// Hand-driven clock for code that takes a util::NowFn.
class ManualClock {
 public:
  explicit ManualClock(util::TimePoint start = util::FromUnixMillis(1'700'000'000'000)) : now_(start) {
  }

  util::TimePoint Now() const {
    std::lock_guard lock(mutex_);
    return now_;
  }

  uint64_t NowMs() const {
    return util::ToUnixMillis(Now());
  }

  void Advance(std::chrono::milliseconds d) {
    std::lock_guard lock(mutex_);
    now_ += d;
  }

  util::NowFn Fn() {
    return [this] { return Now(); };
  }

 private:
  mutable std::mutex mutex_;
  util::TimePoint    now_;
};

} // namespace jobq::testing
