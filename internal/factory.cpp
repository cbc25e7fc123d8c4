#include "factory.hpp"

#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace execmon::factory {

void Application::Shutdown() {
  if (scheduler) {
    scheduler->Stop();
  }
}

std::shared_ptr<publish::MetadataSink> BuildSink(const execmon::runtime::config::PublisherConfig& config) {
  const auto& kind = config.sink();
  if (kind.empty() || kind == "stdout") {
    return std::make_shared<publish::StreamMetadataSink>(std::cout);
  }
  if (kind == "file") {
    if (config.path().empty()) {
      throw util::InvalidConfig("Invalid configuration: publisher.path is required for the file sink");
    }
    return publish::StreamMetadataSink::OpenFile(config.path());
  }
  if (kind == "none") {
    return std::make_shared<publish::NullMetadataSink>();
  }
  throw util::InvalidConfig("Invalid configuration: unknown publisher.sink '" + kind + "'");
}

/*
    Build monitoring dependency graph
*/
Application Build(const execmon::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<kernel::InterruptHandle> interrupter,
                  std::shared_ptr<publish::MetadataSink>   sink) {
  Application app;
  app.monitor_config = config::ResolveMonitorConfig(config);

  // ------------------------------------------------------------------
  // Publication
  // ------------------------------------------------------------------
  app.sink      = sink ? std::move(sink) : BuildSink(config.publisher());
  app.publisher = std::make_shared<publish::MetadataPublisher>(app.sink, observability::GetLogger("publisher"),
                                                               config.diagnostics().debug_transport_messages());

  // ------------------------------------------------------------------
  // Tracking (always on)
  // ------------------------------------------------------------------
  app.tracker = std::make_shared<tracking::ExecutionTracker>(observability::GetLogger("tracker"), app.publisher);

  // ------------------------------------------------------------------
  // Timeout monitoring (optional)
  // ------------------------------------------------------------------
  if (app.monitor_config.enabled) {
    app.scheduler = std::make_shared<scheduler::DeadlineScheduler>(observability::GetLogger("scheduler"),
                                                                   app.monitor_config.max_pending_timers);
    app.scheduler->Start();

    app.timeout_monitor = std::make_shared<timeout::TimeoutMonitor>(app.monitor_config, app.scheduler, std::move(interrupter),
                                                                    app.publisher, observability::GetLogger("timeout"));
  }

  return app;
}

void Attach(const Application& app, kernel::EventManager& events) {
  auto tracker = app.tracker;
  auto monitor = app.timeout_monitor;

  events.Register(kernel::InfoEvent::kPreRunCell,
                  [tracker](const kernel::ExecutionInfo& info) { tracker->OnPreRunCell(info.raw_cell); });

  events.Register(kernel::InfoEvent::kPreExecute, [tracker, monitor](const kernel::ExecutionInfo& info) {
    const auto sequence = tracker->OnPreExecute(info.cell_id, info.raw_cell);
    if (monitor && sequence != model::kUnknownSequence) {
      monitor->OnPreExecute(sequence, info.raw_cell);
    }
  });

  events.Register(kernel::ResultEvent::kPostExecute, [tracker, monitor](const kernel::ExecutionResult& result) {
    if (monitor) {
      if (auto sequence = tracker->CurrentExecution()) {
        monitor->OnPostExecute(*sequence);
      }
    }
    tracker->OnPostExecute(model::ExecutionOutcome{result.success, result.error_kind});
  });

  events.Register(kernel::ResultEvent::kPostRunCell,
                  [tracker](const kernel::ExecutionResult& result) { tracker->OnPostRunCell(result.execution_count); });
}

} // namespace execmon::factory
