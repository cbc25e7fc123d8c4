#include "internal/scheduler/deadline_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using execmon::scheduler::DeadlineScheduler;
using execmon::testing::LogCapture;
using execmon::testing::WaitFor;
using namespace std::chrono_literals;

void TestCallbacksRunInDeadlineOrder() {
  LogCapture        capture("scheduler");
  DeadlineScheduler scheduler(capture.logger(), 16);
  scheduler.Start();

  std::mutex       mutex;
  std::vector<int> order;
  auto             record = [&](int value) {
    std::lock_guard lock(mutex);
    order.push_back(value);
  };

  scheduler.ScheduleAfter(60ms, [&] { record(3); });
  scheduler.ScheduleAfter(20ms, [&] { record(1); });
  scheduler.ScheduleAfter(40ms, [&] { record(2); });

  assert(WaitFor([&] {
    std::lock_guard lock(mutex);
    return order.size() == 3;
  }));
  assert((order == std::vector<int>{1, 2, 3}));
  assert(scheduler.Pending() == 0);

  scheduler.Stop();
}

void TestCancelledCallbackNeverRuns() {
  LogCapture        capture("scheduler");
  DeadlineScheduler scheduler(capture.logger(), 16);
  scheduler.Start();

  std::atomic<int> cancelled_runs{0};
  std::atomic<int> kept_runs{0};

  const auto cancelled = scheduler.ScheduleAfter(30ms, [&] { cancelled_runs++; });
  scheduler.ScheduleAfter(60ms, [&] { kept_runs++; });

  assert(scheduler.Cancel(cancelled));
  assert(!scheduler.Cancel(cancelled));

  assert(WaitFor([&] { return kept_runs.load() == 1; }));
  assert(cancelled_runs.load() == 0);

  scheduler.Stop();
}

void TestCancelAfterFiringReportsFalse() {
  LogCapture        capture("scheduler");
  DeadlineScheduler scheduler(capture.logger(), 16);
  scheduler.Start();

  std::atomic<bool> fired{false};
  const auto        id = scheduler.ScheduleAfter(1ms, [&] { fired = true; });

  assert(WaitFor([&] { return fired.load(); }));
  assert(!scheduler.Cancel(id));

  scheduler.Stop();
}

void TestCapacityIsEnforced() {
  LogCapture        capture("scheduler");
  DeadlineScheduler scheduler(capture.logger(), 2);
  scheduler.Start();

  const auto first = scheduler.ScheduleAfter(10s, [] {});
  scheduler.ScheduleAfter(10s, [] {});

  bool threw = false;
  try {
    scheduler.ScheduleAfter(10s, [] {});
  } catch (const execmon::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);

  // Cancelling frees a slot.
  assert(scheduler.Cancel(first));
  scheduler.ScheduleAfter(10s, [] {});
  assert(scheduler.Pending() == 2);

  scheduler.Stop();
}

void TestScheduleAfterStopThrows() {
  LogCapture        capture("scheduler");
  DeadlineScheduler scheduler(capture.logger(), 4);
  scheduler.Start();
  scheduler.ScheduleAfter(10s, [] {});
  scheduler.Stop();

  assert(scheduler.Pending() == 0);

  bool threw = false;
  try {
    scheduler.ScheduleAfter(1ms, [] {});
  } catch (const execmon::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestThrowingCallbackIsLoggedAndLoopContinues() {
  LogCapture        capture("scheduler");
  DeadlineScheduler scheduler(capture.logger(), 4);
  scheduler.Start();

  std::atomic<bool> second{false};
  scheduler.ScheduleAfter(5ms, [] { throw std::runtime_error("boom"); });
  scheduler.ScheduleAfter(15ms, [&] { second = true; });

  assert(WaitFor([&] { return second.load(); }));
  assert(capture.Count("Deadline callback failed") == 1);

  scheduler.Stop();
}

void TestManyCancellationsAreCompacted() {
  LogCapture        capture("scheduler");
  DeadlineScheduler scheduler(capture.logger(), 8);
  scheduler.Start();

  // Arm/disarm churn well past the heap compaction threshold.
  for (int i = 0; i < 1000; ++i) {
    const auto id = scheduler.ScheduleAfter(10s, [] {});
    assert(scheduler.Cancel(id));
  }
  assert(scheduler.Pending() == 0);

  std::atomic<bool> fired{false};
  scheduler.ScheduleAfter(1ms, [&] { fired = true; });
  assert(WaitFor([&] { return fired.load(); }));

  scheduler.Stop();
}

} // namespace

int main() {
  TestCallbacksRunInDeadlineOrder();
  TestCancelledCallbackNeverRuns();
  TestCancelAfterFiringReportsFalse();
  TestCapacityIsEnforced();
  TestScheduleAfterStopThrows();
  TestThrowingCallbackIsLoggedAndLoopContinues();
  TestManyCancellationsAreCompacted();

  std::cout << "execmon_unit_deadline_scheduler: pass\n";
  return 0;
}
