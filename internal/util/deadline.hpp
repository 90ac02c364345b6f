#pragma once

#include <chrono>
#include <optional>

namespace streak::util {

/*
  Caller-supplied deadline for retrying entry points.

  Measured on the steady clock so wall-clock jumps (or a ManualClock in
  tests) never expire a request.
*/
class Deadline {
 public:
  using SteadyClock = std::chrono::steady_clock;

  Deadline() = default;

  static Deadline Never() {
    return Deadline{};
  }

  static Deadline At(SteadyClock::time_point at) {
    Deadline d;
    d.at_ = at;
    return d;
  }

  static Deadline After(std::chrono::milliseconds timeout) {
    return At(SteadyClock::now() + timeout);
  }

  bool Expired() const {
    return at_.has_value() && SteadyClock::now() >= *at_;
  }

  bool IsSet() const {
    return at_.has_value();
  }

 private:
  std::optional<SteadyClock::time_point> at_;
};

} // namespace streak::util
