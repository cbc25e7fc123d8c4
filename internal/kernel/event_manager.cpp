#include "internal/kernel/event_manager.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace execmon::kernel {

using observability::IntField;
using observability::StringField;

const char* ToString(InfoEvent event) {
  switch (event) {
    case InfoEvent::kPreRunCell:
      return "pre_run_cell";
    case InfoEvent::kPreExecute:
      return "pre_execute";
  }
  return "unknown";
}

const char* ToString(ResultEvent event) {
  switch (event) {
    case ResultEvent::kPostExecute:
      return "post_execute";
    case ResultEvent::kPostRunCell:
      return "post_run_cell";
  }
  return "unknown";
}

EventManager::EventManager(std::shared_ptr<spdlog::logger> logger, bool debug_event_dispatch)
    : logger_(std::move(logger)), debug_event_dispatch_(debug_event_dispatch) {
}

void EventManager::Register(InfoEvent event, InfoCallback callback) {
  std::lock_guard lock(mutex_);
  auto&           callbacks = event == InfoEvent::kPreRunCell ? pre_run_cell_ : pre_execute_;
  callbacks.push_back(std::move(callback));
}

void EventManager::Register(ResultEvent event, ResultCallback callback) {
  std::lock_guard lock(mutex_);
  auto&           callbacks = event == ResultEvent::kPostExecute ? post_execute_ : post_run_cell_;
  callbacks.push_back(std::move(callback));
}

std::vector<EventManager::InfoCallback> EventManager::Snapshot(InfoEvent event) const {
  std::lock_guard lock(mutex_);
  return event == InfoEvent::kPreRunCell ? pre_run_cell_ : pre_execute_;
}

std::vector<EventManager::ResultCallback> EventManager::Snapshot(ResultEvent event) const {
  std::lock_guard lock(mutex_);
  return event == ResultEvent::kPostExecute ? post_execute_ : post_run_cell_;
}

// Callbacks run outside the registry lock so they may register further hooks.
void EventManager::Trigger(InfoEvent event, const ExecutionInfo& info) {
  const auto callbacks = Snapshot(event);
  if (debug_event_dispatch_) {
    observability::Log(*logger_, spdlog::level::debug, "Dispatching event",
                       {StringField("event", ToString(event)), IntField("callbacks", static_cast<std::int64_t>(callbacks.size())),
                        StringField("cell_id", info.cell_id.value_or("unknown"))});
  }

  for (const auto& callback : callbacks) {
    try {
      callback(info);
    } catch (const std::exception& e) {
      observability::Log(*logger_, spdlog::level::warn, "Error in event callback",
                         {StringField("event", ToString(event)), StringField("error", e.what())});
    }
  }
}

void EventManager::Trigger(ResultEvent event, const ExecutionResult& result) {
  const auto callbacks = Snapshot(event);
  if (debug_event_dispatch_) {
    observability::Log(*logger_, spdlog::level::debug, "Dispatching event",
                       {StringField("event", ToString(event)), IntField("callbacks", static_cast<std::int64_t>(callbacks.size())),
                        IntField("exec_count", result.execution_count)});
  }

  for (const auto& callback : callbacks) {
    try {
      callback(result);
    } catch (const std::exception& e) {
      observability::Log(*logger_, spdlog::level::warn, "Error in event callback",
                         {StringField("event", ToString(event)), StringField("error", e.what())});
    }
  }
}

std::size_t EventManager::CallbackCount(InfoEvent event) const {
  return Snapshot(event).size();
}

std::size_t EventManager::CallbackCount(ResultEvent event) const {
  return Snapshot(event).size();
}

} // namespace execmon::kernel
