#include "internal/kernel/cell_script.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "tests/support/test_support.hpp"

namespace {

using execmon::kernel::ExecutionInfo;
using execmon::kernel::Kernel;
using execmon::kernel::ParseCellCommand;
using execmon::kernel::ParseCellScript;
using execmon::testing::LogCapture;
using execmon::testing::WaitFor;
using namespace std::chrono_literals;

bool Rejected(const std::string& command) {
  try {
    (void)ParseCellCommand(command);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestScriptSkipsCommentsAndBlankLines() {
  std::istringstream in(R"(# warm up
noop

  sleep 0.01
raise ValueError
)");

  const auto cells = ParseCellScript(in);
  assert(cells.size() == 3);
  assert(cells[0].line == 2);
  assert(cells[0].info.cell_id == std::string("cell-2"));
  assert(cells[1].line == 4);
  assert(cells[1].info.raw_cell == "sleep 0.01");
  assert(cells[2].info.raw_cell == "raise ValueError");
}

void TestMalformedCommandsAreRejected() {
  assert(Rejected("print(1)"));
  assert(Rejected("sleep"));
  assert(Rejected("sleep -1"));
  assert(Rejected("sleep 5m"));
  assert(Rejected("spin nan"));
  assert(Rejected("raise"));
  assert(Rejected("noop extra"));
  assert(Rejected("sleep 1 2"));

  std::istringstream in("noop\nbogus\n");
  bool               threw = false;
  try {
    (void)ParseCellScript(in);
  } catch (const std::invalid_argument& e) {
    threw = std::string(e.what()).find("line 2") == 0;
  }
  assert(threw);
}

void TestCommandsRunOnKernel() {
  LogCapture capture("kernel");
  Kernel     kernel(capture.logger());

  assert(kernel.RunCell(ExecutionInfo{}, ParseCellCommand("noop")).success);

  auto raised = kernel.RunCell(ExecutionInfo{}, ParseCellCommand("raise KeyError"));
  assert(!raised.success);
  assert(raised.error_kind == std::string("KeyError"));

  const auto started = std::chrono::steady_clock::now();
  assert(kernel.RunCell(ExecutionInfo{}, ParseCellCommand("sleep 0.02")).success);
  assert(std::chrono::steady_clock::now() - started >= 20ms);
}

void TestSpinReportsInterruptOnlyWhenDone() {
  LogCapture capture("kernel");
  Kernel     kernel(capture.logger());

  std::thread interrupter([&] {
    assert(WaitFor([&] { return kernel.IsExecuting(); }));
    assert(kernel.InterruptCurrentExecution());
  });

  const auto started = std::chrono::steady_clock::now();
  auto       result  = kernel.RunCell(ExecutionInfo{}, ParseCellCommand("spin 0.05"));
  interrupter.join();

  assert(std::chrono::steady_clock::now() - started >= 50ms);
  assert(!result.success);
  assert(result.error_kind == std::string("Interrupted"));
}

void TestHugeSleepWaitsForInterrupt() {
  LogCapture capture("kernel");
  Kernel     kernel(capture.logger());

  std::thread interrupter([&] {
    assert(WaitFor([&] { return kernel.IsExecuting(); }));
    std::this_thread::sleep_for(50ms);
    assert(kernel.InterruptCurrentExecution());
  });

  const auto started = std::chrono::steady_clock::now();
  auto       result  = kernel.RunCell(ExecutionInfo{}, ParseCellCommand("sleep 1e10"));
  interrupter.join();

  assert(std::chrono::steady_clock::now() - started >= 50ms);
  assert(result.error_kind == std::string("Interrupted"));
}

} // namespace

int main() {
  TestScriptSkipsCommentsAndBlankLines();
  TestMalformedCommandsAreRejected();
  TestCommandsRunOnKernel();
  TestSpinReportsInterruptOnlyWhenDone();
  TestHugeSleepWaitsForInterrupt();

  std::cout << "execmon_unit_cell_script: pass\n";
  return 0;
}
