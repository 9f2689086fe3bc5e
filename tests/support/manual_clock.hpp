#pragma once

#include <chrono>
#include <mutex>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace stash::testing {

// Clock that only moves when told to.
class ManualClock final : public util::Clock {
 public:
  explicit ManualClock(util::TimePoint start = util::TimePoint(std::chrono::seconds(1'800'000'000))) : now_(start) {
  }

  util::TimePoint Now() const override {
    std::lock_guard lock(mutex_);
    if (fail_next_) {
      fail_next_ = false;
      throw std::runtime_error("clock unavailable");
    }
    return now_;
  }

  // The next Now() throws once.
  void FailNext() {
    std::lock_guard lock(mutex_);
    fail_next_ = true;
  }

  void Advance(std::chrono::seconds delta) {
    std::lock_guard lock(mutex_);
    now_ += delta;
  }

 private:
  mutable std::mutex mutex_;
  mutable bool       fail_next_ = false;
  util::TimePoint    now_;
};

} // namespace stash::testing
