#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace streak::util {

/*
  Time utilities.

  Wall-clock instants are system_clock time points; calendar days are
  sys_days in UTC. Persisted form: Unix milliseconds (0 = null) and
  ISO "YYYY-MM-DD".
*/

using TimePoint = std::chrono::system_clock::time_point;
using Date      = std::chrono::sys_days;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

// Test clock. Thread-safe so sweeps and concurrent actions can share one.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start) : now_(start) {
  }

  TimePoint Now() const override;

  void Set(TimePoint tp);
  void Advance(std::chrono::milliseconds delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// 0 <-> nullopt
uint64_t                 ToNullableMillis(const std::optional<TimePoint>& tp);
std::optional<TimePoint> FromNullableMillis(uint64_t ms);

Date DateOf(TimePoint tp);

std::string FormatDate(Date date);

// Throws InvalidArgument on anything but a valid YYYY-MM-DD.
Date ParseDate(const std::string& text);

std::string FormatTimestamp(TimePoint tp);

} // namespace streak::util
