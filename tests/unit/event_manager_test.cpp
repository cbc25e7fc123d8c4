#include "internal/kernel/event_manager.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "tests/support/test_support.hpp"

namespace {

using execmon::kernel::EventManager;
using execmon::kernel::ExecutionInfo;
using execmon::kernel::ExecutionResult;
using execmon::kernel::InfoEvent;
using execmon::kernel::ResultEvent;
using execmon::testing::LogCapture;

void TestCallbacksRunInRegistrationOrder() {
  LogCapture   capture("events");
  EventManager events(capture.logger());

  std::vector<std::string> calls;
  events.Register(InfoEvent::kPreExecute, [&](const ExecutionInfo& info) { calls.push_back("a:" + info.raw_cell); });
  events.Register(InfoEvent::kPreExecute, [&](const ExecutionInfo& info) { calls.push_back("b:" + info.raw_cell); });
  events.Register(InfoEvent::kPreRunCell, [&](const ExecutionInfo&) { calls.push_back("run"); });

  events.Trigger(InfoEvent::kPreExecute, ExecutionInfo{std::nullopt, "x"});

  assert((calls == std::vector<std::string>{"a:x", "b:x"}));
  assert(events.CallbackCount(InfoEvent::kPreExecute) == 2);
  assert(events.CallbackCount(InfoEvent::kPreRunCell) == 1);
  assert(events.CallbackCount(ResultEvent::kPostExecute) == 0);
}

void TestThrowingCallbackDoesNotStopOthers() {
  LogCapture   capture("events");
  EventManager events(capture.logger());

  int reached = 0;
  events.Register(ResultEvent::kPostExecute, [](const ExecutionResult&) { throw std::runtime_error("broken hook"); });
  events.Register(ResultEvent::kPostExecute, [&](const ExecutionResult& result) { reached = static_cast<int>(result.execution_count); });

  ExecutionResult result;
  result.execution_count = 7;
  events.Trigger(ResultEvent::kPostExecute, result);

  assert(reached == 7);
  const auto errors = capture.Matching("Error in event callback");
  assert(errors.size() == 1);
  assert(errors[0].text.find("event=post_execute") != std::string::npos);
  assert(errors[0].text.find("error=broken hook") != std::string::npos);
}

void TestDispatchDebugLogging() {
  LogCapture   capture("events");
  EventManager quiet(capture.logger());
  EventManager verbose(capture.logger(), true);

  quiet.Trigger(InfoEvent::kPreRunCell, ExecutionInfo{});
  assert(capture.Count("Dispatching event") == 0);

  verbose.Trigger(InfoEvent::kPreRunCell, ExecutionInfo{std::string("c1"), "x"});
  const auto lines = capture.Matching("Dispatching event");
  assert(lines.size() == 1);
  assert(lines[0].level == spdlog::level::debug);
  assert(lines[0].text.find("event=pre_run_cell") != std::string::npos);
  assert(lines[0].text.find("cell_id=c1") != std::string::npos);
}

void TestCallbackMayRegisterDuringDispatch() {
  LogCapture   capture("events");
  EventManager events(capture.logger());

  int late_calls = 0;
  events.Register(InfoEvent::kPreExecute, [&](const ExecutionInfo&) {
    events.Register(InfoEvent::kPreExecute, [&](const ExecutionInfo&) { late_calls++; });
  });

  events.Trigger(InfoEvent::kPreExecute, ExecutionInfo{});
  assert(late_calls == 0);
  assert(events.CallbackCount(InfoEvent::kPreExecute) == 2);
}

} // namespace

int main() {
  TestCallbacksRunInRegistrationOrder();
  TestThrowingCallbackDoesNotStopOthers();
  TestDispatchDebugLogging();
  TestCallbackMayRegisterDuringDispatch();

  std::cout << "execmon_unit_event_manager: pass\n";
  return 0;
}
