#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "internal/kernel/execution_info.hpp"
#include "internal/kernel/kernel.hpp"

namespace execmon::kernel {

/*
  Cell commands understood by the command line driver, one per line:

    sleep <seconds>   interruptible wait
    spin <seconds>    busy loop, reaches a checkpoint only when done
    raise <Kind>      fails with CellError(Kind)
    noop

  Blank lines and lines starting with '#' are not cells.
*/
struct ScriptCell {
  std::size_t   line{0};
  ExecutionInfo info;
  CellBody      body;
};

// Throws std::invalid_argument on an unknown or malformed command.
CellBody ParseCellCommand(std::string_view command);

// Cell ids are "cell-<line>". Errors carry the offending line number.
std::vector<ScriptCell> ParseCellScript(std::istream& in);

} // namespace execmon::kernel
