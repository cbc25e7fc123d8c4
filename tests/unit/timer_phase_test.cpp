#include "internal/model/timer_phase.hpp"

#include <cassert>
#include <cstring>
#include <iostream>

namespace {

using execmon::model::CanTransition;
using execmon::model::IsTerminal;
using execmon::model::TimerPhase;

constexpr TimerPhase kAll[] = {TimerPhase::kArmed, TimerPhase::kWarned, TimerPhase::kTimedOut, TimerPhase::kInterrupted,
                               TimerPhase::kDisarmed};

static_assert(CanTransition(TimerPhase::kArmed, TimerPhase::kWarned));
static_assert(!CanTransition(TimerPhase::kDisarmed, TimerPhase::kWarned));

void TestForwardPath() {
  assert(CanTransition(TimerPhase::kArmed, TimerPhase::kWarned));
  assert(CanTransition(TimerPhase::kWarned, TimerPhase::kTimedOut));
  assert(CanTransition(TimerPhase::kTimedOut, TimerPhase::kInterrupted));

  // Warning phase skipped.
  assert(CanTransition(TimerPhase::kArmed, TimerPhase::kTimedOut));

  assert(!CanTransition(TimerPhase::kArmed, TimerPhase::kInterrupted));
  assert(!CanTransition(TimerPhase::kWarned, TimerPhase::kInterrupted));
}

void TestNoBackwardOrSelfTransitions() {
  for (auto from : kAll) {
    assert(!CanTransition(from, from));
    assert(!CanTransition(from, TimerPhase::kArmed));
  }
  assert(!CanTransition(TimerPhase::kTimedOut, TimerPhase::kWarned));
  assert(!CanTransition(TimerPhase::kInterrupted, TimerPhase::kTimedOut));
}

void TestDisarmedIsTerminal() {
  assert(IsTerminal(TimerPhase::kDisarmed));
  for (auto from : kAll) {
    if (from != TimerPhase::kDisarmed) {
      assert(!IsTerminal(from));
      assert(CanTransition(from, TimerPhase::kDisarmed));
    }
  }
  for (auto to : kAll) {
    assert(!CanTransition(TimerPhase::kDisarmed, to));
  }
}

void TestNames() {
  assert(std::strcmp(ToString(TimerPhase::kTimedOut), "TIMED_OUT") == 0);
  assert(std::strcmp(ToString(TimerPhase::kDisarmed), "DISARMED") == 0);
}

} // namespace

int main() {
  TestForwardPath();
  TestNoBackwardOrSelfTransitions();
  TestDisarmedIsTerminal();
  TestNames();

  std::cout << "execmon_unit_timer_phase: pass\n";
  return 0;
}
