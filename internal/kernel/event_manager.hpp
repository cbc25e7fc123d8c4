#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include <spdlog/logger.h>

#include "internal/kernel/execution_info.hpp"

namespace execmon::kernel {

enum class InfoEvent {
  kPreRunCell,
  kPreExecute,
};

enum class ResultEvent {
  kPostExecute,
  kPostRunCell,
};

const char* ToString(InfoEvent event);
const char* ToString(ResultEvent event);

/*
  Lifecycle hook registry of the host.

  Callbacks run in registration order on the triggering thread. A callback
  that throws is logged and skipped; the remaining callbacks still run.
*/
class EventManager {
 public:
  using InfoCallback   = std::function<void(const ExecutionInfo&)>;
  using ResultCallback = std::function<void(const ExecutionResult&)>;

  explicit EventManager(std::shared_ptr<spdlog::logger> logger, bool debug_event_dispatch = false);

  void Register(InfoEvent event, InfoCallback callback);
  void Register(ResultEvent event, ResultCallback callback);

  void Trigger(InfoEvent event, const ExecutionInfo& info);
  void Trigger(ResultEvent event, const ExecutionResult& result);

  std::size_t CallbackCount(InfoEvent event) const;
  std::size_t CallbackCount(ResultEvent event) const;

 private:
  std::vector<InfoCallback>   Snapshot(InfoEvent event) const;
  std::vector<ResultCallback> Snapshot(ResultEvent event) const;

  std::shared_ptr<spdlog::logger> logger_;
  const bool                      debug_event_dispatch_;

  mutable std::mutex          mutex_;
  std::vector<InfoCallback>   pre_run_cell_;
  std::vector<InfoCallback>   pre_execute_;
  std::vector<ResultCallback> post_execute_;
  std::vector<ResultCallback> post_run_cell_;
};

} // namespace execmon::kernel
