#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/kernel/cell_script.hpp"
#include "internal/kernel/kernel.hpp"
#include "internal/observability/logging.hpp"

using execmon::observability::IntField;
using execmon::observability::StringField;

static volatile std::sig_atomic_t g_running    = 1;
static volatile std::sig_atomic_t g_interrupts = 0;

void HandleSignal(int signal) {
  if (signal == SIGINT) {
    g_interrupts = g_interrupts + 1;
    return;
  }
  g_running = 0;
}

static void PrintUsage() {
  std::cerr << "Usage: execmon <config.yaml> OR execmon --config <config.yaml> [--script <cells.txt>]" << std::endl;
}

/*
  Forwards SIGINT to the kernel. A SIGINT with no cell running, or a second
  one for a cell that did not stop, ends the run after the current cell.
*/
static void WatchSignals(execmon::kernel::Kernel& kernel, const std::atomic<bool>& done) {
  std::sig_atomic_t handled        = 0;
  std::int64_t      interrupted_at = 0;

  while (!done && g_running) {
    if (g_interrupts != handled) {
      handled = g_interrupts;

      const auto execution_count = kernel.ExecutionCount();
      if (interrupted_at == execution_count && kernel.IsExecuting()) {
        EXECMON_LOG_WARN("Second interrupt, stopping after the current cell");
        g_running = 0;
      } else if (kernel.InterruptCurrentExecution()) {
        interrupted_at = execution_count;
        EXECMON_LOG_INFO("User interrupt delivered", {IntField("exec_count", execution_count)});
      } else {
        g_running = 0;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string script_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if ((argc == 3 || argc == 5) && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    if (argc == 5) {
      if (std::string(argv[3]) != "--script") {
        PrintUsage();
        return 1;
      }
      script_path = argv[4];
    }
  } else {
    PrintUsage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = execmon::config::ConfigLoader::LoadFromYaml(config_path);
    execmon::config::ConfigLoader::ApplyEnvironmentOverrides(&config);

    execmon::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto kernel = std::make_shared<execmon::kernel::Kernel>(execmon::observability::GetLogger("kernel"),
                                                            config.diagnostics().debug_event_dispatch());
    auto app    = execmon::factory::Build(config, kernel);
    execmon::factory::Attach(app, kernel->Events());

    // ------------------------------------------------------------
    // Read cells
    // ------------------------------------------------------------
    std::vector<execmon::kernel::ScriptCell> cells;
    if (script_path.empty()) {
      cells = execmon::kernel::ParseCellScript(std::cin);
    } else {
      std::ifstream script(script_path);
      if (!script) {
        throw std::runtime_error("Failed to open script: " + script_path);
      }
      cells = execmon::kernel::ParseCellScript(script);
    }

    // Register signal handlers before the first cell runs.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> done{false};
    std::thread       watcher(WatchSignals, std::ref(*kernel), std::cref(done));

    EXECMON_LOG_INFO("execmon started", {IntField("cells", static_cast<std::int64_t>(cells.size())),
                                         StringField("monitoring", app.timeout_monitor ? "enabled" : "disabled")});

    try {
      for (const auto& cell : cells) {
        if (!g_running) break;
        kernel->RunCell(cell.info, cell.body);
      }
    } catch (...) {
      done = true;
      watcher.join();
      throw;
    }

    done = true;
    watcher.join();

    EXECMON_LOG_INFO("Shutting down execmon", {IntField("executions", static_cast<std::int64_t>(app.tracker->ExecutionCount()))});

    app.Shutdown();
    execmon::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    EXECMON_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    execmon::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
