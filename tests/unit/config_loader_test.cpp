#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using streak::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "streak_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Exception>
bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "/var/lib/streak/streaks.db"
engine:
  pair_window: "3600s"
  cas_max_attempts: 7
  default_deadline: "0.250s"
scoring:
  base_points: 2
  max_penalty: 2
  streak_lookback_days: 14
sweep:
  enabled: true
  workers: 3
  poll_interval: "30s"
  partial_retries: 5
logging:
  level: "debug"
observability:
  metrics_enabled: false
  transport: "OTLP_TRANSPORT_HTTP"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/streak/streaks.db");
  assert(config.engine().cas_max_attempts() == 7);
  assert(config.scoring().base_points() == 2);
  assert(config.scoring().max_penalty() == 2);
  assert(config.scoring().streak_lookback_days() == 14);
  assert(config.sweep().enabled());
  assert(config.sweep().workers() == 3);
  assert(config.sweep().partial_retries() == 5);
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == streak::runtime::config::OTLP_TRANSPORT_HTTP);

  using std::chrono::milliseconds;
  const auto& engine = config.engine();
  assert(streak::config::DurationOr(engine.pair_window(), engine.has_pair_window(), milliseconds(1)) ==
         std::chrono::hours(1));
  assert(streak::config::DurationOr(engine.default_deadline(), engine.has_default_deadline(), milliseconds(1)) ==
         milliseconds(250));
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(!config.engine().has_pair_window());
  assert(streak::config::DurationOr(config.engine().pair_window(), config.engine().has_pair_window(),
                                    std::chrono::hours(24)) == std::chrono::hours(24));
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\streak\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\streak\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const bool threw = Rejects<std::runtime_error>("unknown_field",
                                                 R"(engine:
  pair_window: "86400s"
unknown_field: 123
)");

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestOutOfRangeValuesAreRejected() {
  assert(Rejects<std::invalid_argument>("max_penalty", "scoring:\n  max_penalty: 4\n"));
  assert(Rejects<std::invalid_argument>("penalty_order", "scoring:\n  base_penalty: 3\n  max_penalty: 2\n"));
  assert(Rejects<std::invalid_argument>("empty_sqlite_path", "database:\n  sqlite:\n    path: \"\"\n"));
  assert(Rejects<std::invalid_argument>("zero_window", "engine:\n  pair_window: \"0s\"\n"));
  assert(Rejects<std::invalid_argument>("workers", "sweep:\n  workers: 65\n"));
  assert(Rejects<std::invalid_argument>("log_level", "logging:\n  level: \"verbose\"\n"));
  assert(Rejects<std::runtime_error>("trace_context", "logging:\n  include_trace_context: true\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/streak-engine.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestEmptyFileYieldsDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "streak_engine_unit_config_loader: pass\n";
  return 0;
}
