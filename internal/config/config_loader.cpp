#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace medianode::config {

using medianode::runtime::config::RuntimeConfig;

namespace {

constexpr const char*   kDefaultBindAddress        = "0.0.0.0:50061";
constexpr std::int64_t  kDefaultIdleGraceSeconds   = 300;
constexpr std::int64_t  kDefaultCanceledRetention  = 30;
constexpr std::int64_t  kDefaultReaperPollSeconds  = 1;
constexpr std::uint32_t kDefaultNodeCapacity       = 100;
constexpr std::uint32_t kDefaultMinSpareCapacity   = 20;
constexpr std::uint32_t kDefaultTerminationRetries = 3;
constexpr std::int64_t  kDefaultRetryBackoffSecs   = 30;
constexpr std::uint32_t kDefaultMaxPendingRequests = 1024;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // Quoted scalars stay strings so "30s" and "0042" are not reinterpreted.
  if (node.Tag() != "!") {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (!scalar_value.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
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
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  // An empty document is an all-defaults config.
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

  return config;
}

void SetSeconds(google::protobuf::Duration* duration, std::int64_t seconds) {
  duration->set_seconds(seconds);
  duration->set_nanos(0);
}

bool IsNegative(const google::protobuf::Duration& duration) {
  return duration.seconds() < 0 || duration.nanos() < 0;
}

bool IsZero(const google::protobuf::Duration& duration) {
  return duration.seconds() == 0 && duration.nanos() == 0;
}

} // namespace

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

  auto config = ParseYaml(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }

  auto* lifecycle = config.mutable_lifecycle();
  if (!lifecycle->has_idle_grace_period()) {
    SetSeconds(lifecycle->mutable_idle_grace_period(), kDefaultIdleGraceSeconds);
  }
  if (!lifecycle->has_canceled_retention()) {
    SetSeconds(lifecycle->mutable_canceled_retention(), kDefaultCanceledRetention);
  }
  if (!lifecycle->has_reaper_poll_interval()) {
    SetSeconds(lifecycle->mutable_reaper_poll_interval(), kDefaultReaperPollSeconds);
  }

  auto* autoscale = config.mutable_autoscale();
  if (autoscale->node_capacity() == 0) {
    autoscale->set_node_capacity(kDefaultNodeCapacity);
  }
  if (autoscale->min_spare_capacity() == 0) {
    autoscale->set_min_spare_capacity(kDefaultMinSpareCapacity);
  }

  auto* provisioning = config.mutable_provisioning();
  if (!provisioning->has_max_termination_retries()) {
    provisioning->set_max_termination_retries(kDefaultTerminationRetries);
  }
  if (!provisioning->has_termination_retry_backoff()) {
    SetSeconds(provisioning->mutable_termination_retry_backoff(), kDefaultRetryBackoffSecs);
  }
  if (provisioning->max_pending_requests() == 0) {
    provisioning->set_max_pending_requests(kDefaultMaxPendingRequests);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& lifecycle = config.lifecycle();
  if (IsNegative(lifecycle.idle_grace_period())) {
    throw std::invalid_argument("lifecycle.idle_grace_period must not be negative");
  }
  if (IsNegative(lifecycle.canceled_retention())) {
    throw std::invalid_argument("lifecycle.canceled_retention must not be negative");
  }
  if (IsNegative(lifecycle.reaper_poll_interval()) || IsZero(lifecycle.reaper_poll_interval())) {
    throw std::invalid_argument("lifecycle.reaper_poll_interval must be positive");
  }

  if (IsNegative(config.provisioning().termination_retry_backoff())) {
    throw std::invalid_argument("provisioning.termination_retry_backoff must not be negative");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && level != "trace" && level != "debug" && level != "info" && level != "warn" && level != "error" &&
      level != "critical" && level != "off") {
    throw std::invalid_argument("logging.level must be one of trace, debug, info, warn, error, critical, off");
  }
}

} // namespace medianode::config
