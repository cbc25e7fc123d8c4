#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/config/monitor_config.hpp"

namespace execmon::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static execmon::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // EXECMON_* variables win over the file.
  static void ApplyEnvironmentOverrides(execmon::runtime::config::RuntimeConfig* config);
};

/*
  Fills defaults and validates thresholds.

  Throws util::InvalidConfig when warning >= timeout with both phases
  enabled, or when a threshold is not finite.
*/
MonitorConfig ResolveMonitorConfig(const execmon::runtime::config::RuntimeConfig& config);

} // namespace execmon::config
