#pragma once

#include <mutex>
#include <optional>
#include <string>

#include "internal/model/execution_record.hpp"
#include "internal/model/timer_phase.hpp"
#include "internal/scheduler/deadline_scheduler.hpp"
#include "internal/util/time.hpp"

namespace execmon::timeout {

/*
  Deadline bookkeeping for one in-flight execution.

  `mutex` is the single guard for every phase transition of this execution;
  nothing else is shared with the timer thread.
*/
struct TimerState {
  model::SequenceNumber execution_ref{model::kUnknownSequence};

  util::TimePoint start_time{};
  util::TimePoint warning_deadline{};
  util::TimePoint timeout_deadline{};

  std::string code_preview;

  std::optional<scheduler::TimerId> warning_timer;
  std::optional<scheduler::TimerId> timeout_timer;

  std::mutex        mutex;
  model::TimerPhase phase{model::TimerPhase::kArmed};
};

} // namespace execmon::timeout
