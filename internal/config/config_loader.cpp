#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <set>
#include <stdexcept>

namespace eventship::config {

using eventship::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultBatchRecords   = 100;
constexpr uint64_t kDefaultBatchBytes     = 64 * 1024;
constexpr int64_t  kDefaultPollSeconds    = 1;
constexpr uint32_t kDefaultOpenAttempts   = 5;
constexpr int64_t  kDefaultInitialBackoff = 1;
constexpr int64_t  kDefaultMaxBackoff     = 30;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings even when they look numeric
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

void SetSecondsIfUnset(google::protobuf::Duration* duration, int64_t seconds) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    duration->set_seconds(seconds);
  }
}

bool IsPositive(const google::protobuf::Duration& duration) {
  return duration.seconds() > 0 || (duration.seconds() == 0 && duration.nanos() > 0);
}

RuntimeConfig ToConfig(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ToConfig(yaml);
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ToConfig(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* host = config->mutable_host();
  if (host->default_log().empty()) {
    host->set_default_log("Application");
  }

  if (!config->checkpoint().has_sqlite() && !config->checkpoint().has_memory()) {
    config->mutable_checkpoint()->mutable_memory();
  }

  auto* retry = config->mutable_open_retry();
  if (retry->max_attempts() == 0) {
    retry->set_max_attempts(kDefaultOpenAttempts);
  }
  SetSecondsIfUnset(retry->mutable_initial_backoff(), kDefaultInitialBackoff);
  SetSecondsIfUnset(retry->mutable_max_backoff(), kDefaultMaxBackoff);

  for (auto& provider : *config->mutable_providers()) {
    if (provider.resume().empty()) {
      provider.set_resume("checkpoint");
    }
    if (provider.batch_max_records() == 0) {
      provider.set_batch_max_records(kDefaultBatchRecords);
    }
    if (provider.batch_max_bytes() == 0) {
      provider.set_batch_max_bytes(kDefaultBatchBytes);
    }
    SetSecondsIfUnset(provider.mutable_poll_interval(), kDefaultPollSeconds);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.host().registry_dir().empty()) {
    throw std::runtime_error("Invalid configuration: host.registry_dir is required");
  }
  if (config.host().log_dir().empty()) {
    throw std::runtime_error("Invalid configuration: host.log_dir is required");
  }
  if (config.checkpoint().has_sqlite() && config.checkpoint().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: checkpoint.sqlite.path is required");
  }

  const auto& retry = config.open_retry();
  if (!IsPositive(retry.initial_backoff()) || !IsPositive(retry.max_backoff())) {
    throw std::runtime_error("Invalid configuration: open_retry backoffs must be positive");
  }

  std::set<std::string> names;
  for (const auto& provider : config.providers()) {
    if (provider.name().empty()) {
      throw std::runtime_error("Invalid configuration: provider without name");
    }
    if (!names.insert(provider.name()).second) {
      // two engines on one provider would fight over its checkpoint
      throw std::runtime_error("Invalid configuration: duplicate provider " + provider.name());
    }
    if (provider.resume() != "checkpoint" && provider.resume() != "start") {
      throw std::runtime_error("Invalid configuration: provider " + provider.name() + " resume must be checkpoint or start");
    }
    if (provider.batch_max_bytes() > UINT32_MAX) {
      throw std::runtime_error("Invalid configuration: provider " + provider.name() + " batch_max_bytes too large");
    }
  }
}

} // namespace eventship::config
