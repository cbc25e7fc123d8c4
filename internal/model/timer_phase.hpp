#pragma once

#include <cstdint>

namespace execmon::model {

enum class TimerPhase : std::uint8_t {
  kArmed       = 0,
  kWarned      = 1,
  kTimedOut    = 2,
  kInterrupted = 3,
  kDisarmed    = 4,
};

constexpr bool IsTerminal(TimerPhase phase) {
  return phase == TimerPhase::kDisarmed;
}

/*
  ARMED -> WARNED -> TIMED_OUT -> INTERRUPTED, DISARMED from anywhere.

  TIMED_OUT is also reachable straight from ARMED when the warning phase is
  skipped. No self transitions: each phase is entered at most once.
*/
constexpr bool CanTransition(TimerPhase from, TimerPhase to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case TimerPhase::kDisarmed:
      return true;
    case TimerPhase::kWarned:
      return from == TimerPhase::kArmed;
    case TimerPhase::kTimedOut:
      return from == TimerPhase::kArmed || from == TimerPhase::kWarned;
    case TimerPhase::kInterrupted:
      return from == TimerPhase::kTimedOut;
    case TimerPhase::kArmed:
      return false;
  }
  return false;
}

constexpr const char* ToString(TimerPhase phase) {
  switch (phase) {
    case TimerPhase::kArmed:
      return "ARMED";
    case TimerPhase::kWarned:
      return "WARNED";
    case TimerPhase::kTimedOut:
      return "TIMED_OUT";
    case TimerPhase::kInterrupted:
      return "INTERRUPTED";
    case TimerPhase::kDisarmed:
      return "DISARMED";
  }
  return "UNKNOWN";
}

} // namespace execmon::model
