#include "time.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"

namespace streak::util {

TimePoint SystemClock::Now() const {
  return std::chrono::system_clock::now();
}

TimePoint ManualClock::Now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualClock::Set(TimePoint tp) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = tp;
}

void ManualClock::Advance(std::chrono::milliseconds delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += delta;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

uint64_t ToNullableMillis(const std::optional<TimePoint>& tp) {
  return tp ? ToUnixMillis(*tp) : 0;
}

std::optional<TimePoint> FromNullableMillis(uint64_t ms) {
  if (ms == 0) {
    return std::nullopt;
  }
  return FromUnixMillis(ms);
}

Date DateOf(TimePoint tp) {
  return std::chrono::floor<std::chrono::days>(tp);
}

std::string FormatDate(Date date) {
  const std::chrono::year_month_day ymd{date};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

Date ParseDate(const std::string& text) {
  int      y = 0;
  unsigned m = 0;
  unsigned d = 0;
  char     tail;
  if (text.size() != 10 || std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
    throw InvalidArgument("invalid date '" + text + "', expected YYYY-MM-DD");
  }

  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
  if (!ymd.ok()) {
    throw InvalidArgument("invalid calendar date '" + text + "'");
  }
  return Date{ymd};
}

std::string FormatTimestamp(TimePoint tp) {
  const auto day       = DateOf(tp);
  const auto since_day = std::chrono::duration_cast<std::chrono::seconds>(tp - day).count();

  char buf[16];
  std::snprintf(buf, sizeof(buf), "T%02lld:%02lld:%02lldZ", static_cast<long long>(since_day / 3600),
                static_cast<long long>((since_day / 60) % 60), static_cast<long long>(since_day % 60));
  return FormatDate(day) + buf;
}

} // namespace streak::util
