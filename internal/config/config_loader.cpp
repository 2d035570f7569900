#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "internal/http/endpoint.hpp"
#include "internal/util/errors.hpp"

namespace presence::config {

using presence::runtime::config::RuntimeConfig;
using presence::util::InvalidConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("1234" as a password)
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
      throw InvalidConfig("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  if (!yaml.IsMap()) {
    throw InvalidConfig("Configuration root must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  if (const char* password = std::getenv("PRESENCE_APPLIANCE_PASSWORD")) {
    config.mutable_appliance()->set_password(password);
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& content) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(content);
  } catch (const std::exception& e) {
    throw InvalidConfig("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* appliance = config.mutable_appliance();
  if (appliance->request_timeout_ms() == 0) appliance->set_request_timeout_ms(kDefaultRequestTimeoutMs);
  if (appliance->max_devices() == 0) appliance->set_max_devices(kDefaultMaxDevices);
  if (appliance->max_addresses() == 0) appliance->set_max_addresses(kDefaultMaxAddresses);
  if (appliance->query_window() == 0) appliance->set_query_window(kDefaultQueryWindow);

  auto* polling = config.mutable_polling();
  if (polling->poll_interval_seconds() == 0) polling->set_poll_interval_seconds(kDefaultPollIntervalSeconds);
  if (!polling->has_away_threshold_seconds()) polling->set_away_threshold_seconds(kDefaultAwayThresholdSeconds);
  if (polling->max_backoff_seconds() == 0) {
    polling->set_max_backoff_seconds(std::max(kDefaultMaxBackoffSeconds, polling->poll_interval_seconds()));
  }

  auto* sink = config.mutable_sink();
  if (!sink->has_log_transitions()) sink->set_log_transitions(true);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& appliance = config.appliance();
  if (appliance.host().empty()) {
    throw InvalidConfig("appliance.host is required");
  }
  try {
    presence::http::ParseEndpoint(appliance.host());
  } catch (const std::invalid_argument& e) {
    throw InvalidConfig("appliance.host: " + std::string(e.what()));
  }

  const auto& polling = config.polling();
  if (polling.poll_interval_seconds() < kMinPollIntervalSeconds) {
    throw InvalidConfig("polling.poll_interval_seconds must be >= " + std::to_string(kMinPollIntervalSeconds));
  }
  if (polling.away_threshold_seconds() < 0) {
    throw InvalidConfig("polling.away_threshold_seconds must be >= 0");
  }
  if (polling.max_backoff_seconds() < polling.poll_interval_seconds()) {
    throw InvalidConfig("polling.max_backoff_seconds must be >= polling.poll_interval_seconds");
  }
}

} // namespace presence::config
