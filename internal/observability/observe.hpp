#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace streak::observability {

/*
  Wraps one engine entry point: span, request counter, latency histogram,
  and an error log line carrying the subject (user / pair) on failure.
  Exceptions are rethrown unchanged.
*/
template <typename Fn>
auto ObserveCall(std::string_view route, std::string_view subject, Fn&& fn) {
  SpanScope span(route);
  span.SetAttribute("streak.subject", subject);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      Metrics::Instance().RecordRequest(route, true);
      Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      Metrics::Instance().RecordRequest(route, true);
      Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    STREAK_LOG_ERROR("engine call failed",
                     {StringField("route", route), StringField("subject", subject), StringField("error", ex.what())});
    Metrics::Instance().RecordRequest(route, false);
    Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace streak::observability
