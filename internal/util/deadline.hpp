#pragma once

#include <chrono>
#include <string>

#include "internal/util/errors.hpp"

namespace siros::util {

/*
  Caller-supplied deadline carried through every ResourceManager call.

  Checked at phase boundaries only; a backend call that is already
  running is never interrupted.
*/
class Deadline {
 public:
  using Clock = std::chrono::steady_clock;

  static Deadline Never() {
    return Deadline(Clock::time_point::max());
  }

  static Deadline After(std::chrono::milliseconds timeout) {
    return Deadline(Clock::now() + timeout);
  }

  static Deadline At(Clock::time_point at) {
    return Deadline(at);
  }

  bool IsInfinite() const {
    return at_ == Clock::time_point::max();
  }

  bool Expired() const {
    return !IsInfinite() && Clock::now() >= at_;
  }

  // Throws DeadlineExceeded naming the phase that observed expiry.
  void Check(const std::string& phase) const {
    if (Expired()) {
      throw DeadlineExceeded("deadline exceeded " + phase);
    }
  }

 private:
  explicit Deadline(Clock::time_point at) : at_(at) {
  }

  Clock::time_point at_;
};

} // namespace siros::util
