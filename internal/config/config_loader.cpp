#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace execmon::config {

using execmon::runtime::config::RuntimeConfig;

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

// ------------------------------------------------------------
// Environment overrides
// ------------------------------------------------------------

static bool ParseBool(const std::string& name, const std::string& raw) {
  if (raw == "1" || raw == "true" || raw == "TRUE" || raw == "True") return true;
  if (raw == "0" || raw == "false" || raw == "FALSE" || raw == "False") return false;
  throw util::InvalidConfig("Invalid configuration: " + name + " must be a boolean, got '" + raw + "'");
}

static double ParseSeconds(const std::string& name, const std::string& raw) {
  char*        endptr = nullptr;
  const double value  = strtod(raw.c_str(), &endptr);
  if (raw.empty() || !endptr || *endptr != '\0') {
    throw util::InvalidConfig("Invalid configuration: " + name + " must be a number of seconds, got '" + raw + "'");
  }
  return value;
}

static const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
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

  // An empty document is a valid "all defaults" config.
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
    throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig* config) {
  if (const char* level = Env("EXECMON_LOG_LEVEL")) {
    config->mutable_logging()->set_level(level);
  }
  if (const char* pattern = Env("EXECMON_LOG_PATTERN")) {
    config->mutable_logging()->set_pattern(pattern);
  }

  auto* monitoring = config->mutable_monitoring();
  if (const char* enabled = Env("EXECMON_ENABLE_TIMEOUT_MONITORING")) {
    monitoring->set_enable_timeout_monitoring(ParseBool("EXECMON_ENABLE_TIMEOUT_MONITORING", enabled));
  }
  if (const char* warning = Env("EXECMON_WARNING_THRESHOLD")) {
    monitoring->set_warning_threshold(ParseSeconds("EXECMON_WARNING_THRESHOLD", warning));
  }
  if (const char* timeout = Env("EXECMON_TIMEOUT_THRESHOLD")) {
    monitoring->set_timeout_threshold(ParseSeconds("EXECMON_TIMEOUT_THRESHOLD", timeout));
  }
  if (const char* auto_interrupt = Env("EXECMON_AUTO_INTERRUPT")) {
    monitoring->set_auto_interrupt(ParseBool("EXECMON_AUTO_INTERRUPT", auto_interrupt));
  }

  auto* diagnostics = config->mutable_diagnostics();
  if (const char* dispatch = Env("EXECMON_DEBUG_EVENT_DISPATCH")) {
    diagnostics->set_debug_event_dispatch(ParseBool("EXECMON_DEBUG_EVENT_DISPATCH", dispatch));
  }
  if (const char* transport = Env("EXECMON_DEBUG_TRANSPORT_MESSAGES")) {
    diagnostics->set_debug_transport_messages(ParseBool("EXECMON_DEBUG_TRANSPORT_MESSAGES", transport));
  }
}

MonitorConfig ResolveMonitorConfig(const RuntimeConfig& config) {
  const auto&   monitoring = config.monitoring();
  MonitorConfig resolved;

  resolved.enabled                = monitoring.enable_timeout_monitoring();
  resolved.auto_interrupt_enabled = monitoring.auto_interrupt();

  if (monitoring.has_warning_threshold()) {
    resolved.warning_threshold_seconds = monitoring.warning_threshold();
  }
  if (monitoring.has_timeout_threshold()) {
    resolved.timeout_threshold_seconds = monitoring.timeout_threshold();
  }
  if (monitoring.has_max_pending_timers()) {
    if (monitoring.max_pending_timers() == 0) {
      throw util::InvalidConfig("Invalid configuration: monitoring.max_pending_timers must be positive");
    }
    resolved.max_pending_timers = monitoring.max_pending_timers();
  }

  if (!std::isfinite(resolved.warning_threshold_seconds) || !std::isfinite(resolved.timeout_threshold_seconds)) {
    throw util::InvalidConfig("Invalid configuration: monitoring thresholds must be finite");
  }

  if (resolved.WarningEnabled() && resolved.TimeoutEnabled() &&
      resolved.warning_threshold_seconds >= resolved.timeout_threshold_seconds) {
    std::ostringstream msg;
    msg << "Invalid configuration: monitoring.warning_threshold (" << resolved.warning_threshold_seconds
        << "s) must be lower than monitoring.timeout_threshold (" << resolved.timeout_threshold_seconds << "s)";
    throw util::InvalidConfig(msg.str());
  }

  return resolved;
}

} // namespace execmon::config
