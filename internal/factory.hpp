#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/monitor_config.hpp"
#include "internal/kernel/event_manager.hpp"
#include "internal/kernel/interrupt_handle.hpp"
#include "internal/publish/metadata_publisher.hpp"
#include "internal/publish/metadata_sink.hpp"
#include "internal/scheduler/deadline_scheduler.hpp"
#include "internal/timeout/timeout_monitor.hpp"
#include "internal/tracking/execution_tracker.hpp"

namespace execmon::factory {

/*
  Application

  Owns the monitoring components for the lifetime of the host.
  scheduler and timeout_monitor are null when timeout monitoring is off.
*/
struct Application {
  config::MonitorConfig monitor_config;

  std::shared_ptr<publish::MetadataSink>       sink;
  std::shared_ptr<publish::MetadataPublisher>  publisher;
  std::shared_ptr<tracking::ExecutionTracker>  tracker;
  std::shared_ptr<scheduler::DeadlineScheduler> scheduler;
  std::shared_ptr<timeout::TimeoutMonitor>     timeout_monitor;

  // Stops the timer thread; pending deadlines are dropped.
  void Shutdown();
};

std::shared_ptr<publish::MetadataSink> BuildSink(const execmon::runtime::config::PublisherConfig& config);

/*
  Build

  Composition root. Validates the monitoring thresholds (throws
  util::InvalidConfig) and wires the components. A null sink is built
  from config.publisher().
*/
Application Build(const execmon::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<kernel::InterruptHandle> interrupter,
                  std::shared_ptr<publish::MetadataSink>   sink = nullptr);

/*
  Attach

  Registers the lifecycle hooks. On post_execute the timeout monitor
  disarms before the tracker logs EXEC_END, so no deadline log can follow
  the end of its execution.
*/
void Attach(const Application& app, kernel::EventManager& events);

} // namespace execmon::factory
