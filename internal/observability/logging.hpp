#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace streak::runtime::config {
class RuntimeConfig;
}

namespace streak::observability {

/*
  One key=value pair of a structured log line. Values containing spaces,
  '=' or quotes are written quoted so lines stay machine-splittable.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UIntField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DateField(std::string_view key, util::Date value);
LogField TimestampField(std::string_view key, util::TimePoint value);

// "trace".."critical", "off". Throws std::invalid_argument otherwise.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

// Renders "message k=v k2=v2".
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields);

// STREAK_LOG_LEVEL / STREAK_LOG_PATTERN override the config file.
void InitializeLogging(const streak::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace streak::observability

#define STREAK_LOG_INFO(message, ...) \
  ::streak::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define STREAK_LOG_WARN(message, ...) \
  ::streak::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define STREAK_LOG_ERROR(message, ...) \
  ::streak::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
