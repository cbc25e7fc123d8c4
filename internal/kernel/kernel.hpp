#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include <spdlog/logger.h>

#include "internal/kernel/event_manager.hpp"
#include "internal/kernel/execution_info.hpp"
#include "internal/kernel/interrupt_handle.hpp"
#include "internal/util/time.hpp"

namespace execmon::kernel {

class Kernel;

/*
  What a running cell sees of the host.

  Checkpoint() and Sleep() are the interruption points: a pending interrupt
  surfaces there as ExecutionInterrupted. Code between checkpoints cannot
  be preempted.
*/
class ExecutionContext {
 public:
  void Checkpoint();

  // Returns early by throwing ExecutionInterrupted.
  void Sleep(util::Clock::duration duration);

  std::int64_t ExecutionCount() const {
    return execution_count_;
  }

 private:
  friend class Kernel;

  ExecutionContext(Kernel& kernel, std::int64_t execution_count) : kernel_(kernel), execution_count_(execution_count) {
  }

  Kernel&      kernel_;
  std::int64_t execution_count_;
};

using CellBody = std::function<void(ExecutionContext&)>;

/*
  Minimal cooperative execution host.

  Runs one cell at a time on the calling thread and fires the lifecycle
  hooks around it. InterruptCurrentExecution() may be called from any
  thread.
*/
class Kernel : public InterruptHandle {
 public:
  explicit Kernel(std::shared_ptr<spdlog::logger> logger, bool debug_event_dispatch = false);

  EventManager& Events() {
    return events_;
  }

  // Throws util::InvalidState when called while another cell is running.
  ExecutionResult RunCell(const ExecutionInfo& info, const CellBody& body);

  bool InterruptCurrentExecution() override;

  bool         IsExecuting() const;
  std::int64_t ExecutionCount() const;

 private:
  friend class ExecutionContext;

  void ThrowIfInterrupted();
  void SleepInterruptibly(util::Clock::duration duration);

  std::shared_ptr<spdlog::logger> logger_;
  EventManager                    events_;

  mutable std::mutex      mutex_;
  std::condition_variable interrupt_cv_;
  bool                    executing_{false};
  bool                    interrupt_pending_{false};
  std::int64_t            execution_count_{0};
};

} // namespace execmon::kernel
