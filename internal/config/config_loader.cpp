#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace streak::config {

using streak::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

std::chrono::milliseconds DurationOr(const google::protobuf::Duration& duration, bool is_set,
                                     std::chrono::milliseconds fallback) {
  if (!is_set) {
    return fallback;
  }
  return std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(duration));
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // empty file: all defaults
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path must not be empty");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri must not be empty");
  }

  const auto& engine = config.engine();
  if (engine.has_pair_window() && google::protobuf::util::TimeUtil::DurationToMilliseconds(engine.pair_window()) <= 0) {
    throw std::invalid_argument("engine.pair_window must be positive");
  }
  if (engine.has_default_deadline() &&
      google::protobuf::util::TimeUtil::DurationToMilliseconds(engine.default_deadline()) <= 0) {
    throw std::invalid_argument("engine.default_deadline must be positive");
  }

  // habit_days.penalty_applied is bounded to 0..3 in storage
  if (config.scoring().max_penalty() > 3) {
    throw std::invalid_argument("scoring.max_penalty must be at most 3");
  }
  if (config.scoring().base_penalty() > 0 && config.scoring().max_penalty() > 0 &&
      config.scoring().base_penalty() > config.scoring().max_penalty()) {
    throw std::invalid_argument("scoring.base_penalty must not exceed scoring.max_penalty");
  }

  if (config.sweep().workers() > 64) {
    throw std::invalid_argument("sweep.workers must be at most 64");
  }

  if (!config.logging().level().empty()) {
    observability::ParseLogLevel(config.logging().level());
  }
}

} // namespace streak::config
