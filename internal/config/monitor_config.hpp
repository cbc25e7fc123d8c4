#pragma once

#include <cstddef>

namespace execmon::config {

/*
  Immutable snapshot consumed by the monitoring core.

  Thresholds are in seconds; a value <= 0 disables that phase.
  Produced once per process by ResolveMonitorConfig, already validated.
*/
struct MonitorConfig {
  bool   enabled{false};
  double warning_threshold_seconds{240.0};
  double timeout_threshold_seconds{300.0};
  bool   auto_interrupt_enabled{false};

  std::size_t max_pending_timers{1024};

  bool WarningEnabled() const {
    return warning_threshold_seconds > 0.0;
  }

  bool TimeoutEnabled() const {
    return timeout_threshold_seconds > 0.0;
  }
};

} // namespace execmon::config
