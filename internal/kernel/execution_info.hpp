#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace execmon::kernel {

struct ExecutionInfo {
  std::optional<std::string> cell_id;
  std::string                raw_cell;
};

struct ExecutionResult {
  std::int64_t               execution_count{0};
  bool                       success{true};
  std::optional<std::string> error_kind;
};

inline constexpr const char* kInterruptedErrorKind = "Interrupted";

/*
  Cancellation condition raised inside a cell at a checkpoint, whether the
  interrupt came from the user or from the timeout monitor.
*/
class ExecutionInterrupted : public std::runtime_error {
 public:
  ExecutionInterrupted() : std::runtime_error("execution interrupted") {
  }
};

// A failure raised by cell code, carrying its error kind.
class CellError : public std::runtime_error {
 public:
  CellError(std::string kind, const std::string& msg) : std::runtime_error(msg), kind_(std::move(kind)) {
  }

  const std::string& kind() const {
    return kind_;
  }

 private:
  std::string kind_;
};

} // namespace execmon::kernel
