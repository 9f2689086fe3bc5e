#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace stash::config {

namespace {

constexpr int64_t kDefaultInitialDelaySeconds = 60;
constexpr int64_t kDefaultPeriodSeconds       = 300;

std::string ExpandHome(const std::string& path) {
  if (path.rfind("~/", 0) != 0) {
    return path;
  }
  const char* home = std::getenv("HOME");
  if (!home) {
    return path;
  }
  return (std::filesystem::path(home) / path.substr(2)).string();
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("60s", "0.0.0.0")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

stash::config::v1::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  stash::config::v1::RuntimeConfig config;

  // an empty file is a valid "all defaults" config
  if (!yaml.IsNull()) {
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
  }

  ApplyDefaults(&config);
  return config;
}

stash::config::v1::RuntimeConfig ConfigLoader::Defaults() {
  stash::config::v1::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(stash::config::v1::RuntimeConfig* config) {
  auto* database = config->mutable_database();
  if (!database->has_sqlite() && !database->has_memory()) {
    auto* sqlite = database->mutable_sqlite();
    sqlite->set_path(DefaultDatabasePath());
    sqlite->set_wal_mode(true);
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    sqlite->set_path(sqlite->path().empty() ? DefaultDatabasePath() : ExpandHome(sqlite->path()));
  }

  auto* escalation = config->mutable_escalation();
  if (!escalation->has_enabled()) {
    escalation->set_enabled(true);
  }
  if (!escalation->has_notifications_enabled()) {
    escalation->set_notifications_enabled(true);
  }
  if (!escalation->has_initial_delay()) {
    escalation->mutable_initial_delay()->set_seconds(kDefaultInitialDelaySeconds);
  }
  if (!escalation->has_period()) {
    escalation->mutable_period()->set_seconds(kDefaultPeriodSeconds);
  }
  if (escalation->period().seconds() <= 0 && escalation->period().nanos() <= 0) {
    throw std::runtime_error("Invalid configuration: escalation.period must be positive");
  }
}

std::string ConfigLoader::DefaultDatabasePath() {
  if (const char* stash_home = std::getenv("STASH_HOME")) {
    return (std::filesystem::path(stash_home) / "stash.db").string();
  }
  if (const char* home = std::getenv("HOME")) {
    return (std::filesystem::path(home) / ".stash" / "stash.db").string();
  }
  return "stash.db";
}

} // namespace stash::config
