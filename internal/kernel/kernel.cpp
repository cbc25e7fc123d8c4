#include "internal/kernel/kernel.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace execmon::kernel {

using observability::IntField;
using observability::StringField;

void ExecutionContext::Checkpoint() {
  kernel_.ThrowIfInterrupted();
}

void ExecutionContext::Sleep(util::Clock::duration duration) {
  kernel_.SleepInterruptibly(duration);
}

Kernel::Kernel(std::shared_ptr<spdlog::logger> logger, bool debug_event_dispatch)
    : logger_(logger), events_(std::move(logger), debug_event_dispatch) {
}

ExecutionResult Kernel::RunCell(const ExecutionInfo& info, const CellBody& body) {
  std::int64_t execution_count = 0;
  {
    std::lock_guard lock(mutex_);
    if (executing_) {
      throw util::InvalidState("a cell is already executing");
    }
    executing_         = true;
    interrupt_pending_ = false;
    execution_count    = ++execution_count_;
  }

  // Hooks run without the kernel lock so an interrupt can arrive at any time.
  events_.Trigger(InfoEvent::kPreRunCell, info);
  events_.Trigger(InfoEvent::kPreExecute, info);

  ExecutionResult result;
  result.execution_count = execution_count;

  ExecutionContext context(*this, execution_count);
  try {
    if (body) {
      body(context);
    }
  } catch (const ExecutionInterrupted&) {
    result.success    = false;
    result.error_kind = kInterruptedErrorKind;
  } catch (const CellError& e) {
    result.success    = false;
    result.error_kind = e.kind();
  } catch (const std::exception& e) {
    result.success    = false;
    result.error_kind = "Exception";
    observability::Log(*logger_, spdlog::level::debug, "Cell raised",
                       {IntField("exec_count", execution_count), StringField("error", e.what())});
  }

  {
    std::lock_guard lock(mutex_);
    executing_         = false;
    interrupt_pending_ = false;
  }

  events_.Trigger(ResultEvent::kPostExecute, result);
  events_.Trigger(ResultEvent::kPostRunCell, result);
  return result;
}

bool Kernel::InterruptCurrentExecution() {
  {
    std::lock_guard lock(mutex_);
    if (!executing_) {
      return false;
    }
    interrupt_pending_ = true;
  }
  interrupt_cv_.notify_all();
  return true;
}

bool Kernel::IsExecuting() const {
  std::lock_guard lock(mutex_);
  return executing_;
}

std::int64_t Kernel::ExecutionCount() const {
  std::lock_guard lock(mutex_);
  return execution_count_;
}

void Kernel::ThrowIfInterrupted() {
  std::lock_guard lock(mutex_);
  if (interrupt_pending_) {
    interrupt_pending_ = false;
    throw ExecutionInterrupted();
  }
}

void Kernel::SleepInterruptibly(util::Clock::duration duration) {
  std::unique_lock lock(mutex_);
  const auto       deadline = util::Now() + duration;
  interrupt_cv_.wait_until(lock, deadline, [&] { return interrupt_pending_; });
  if (interrupt_pending_) {
    interrupt_pending_ = false;
    throw ExecutionInterrupted();
  }
}

} // namespace execmon::kernel
