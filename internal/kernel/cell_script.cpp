#include "internal/kernel/cell_script.hpp"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/util/time.hpp"

namespace execmon::kernel {
namespace {

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) return {};
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

double ParseDuration(std::string_view command, const std::string& raw) {
  char*        endptr  = nullptr;
  const double seconds = std::strtod(raw.c_str(), &endptr);
  if (raw.empty() || !endptr || *endptr != '\0' || !std::isfinite(seconds) || seconds < 0) {
    throw std::invalid_argument("Invalid duration in '" + std::string(command) + "'");
  }
  return seconds;
}

} // namespace

CellBody ParseCellCommand(std::string_view command) {
  std::istringstream in{std::string(Trim(command))};
  std::string        verb;
  std::string        argument;
  std::string        extra;
  in >> verb >> argument >> extra;

  if (!extra.empty()) {
    throw std::invalid_argument("Too many arguments in '" + std::string(command) + "'");
  }

  if (verb == "noop" && argument.empty()) {
    return [](ExecutionContext&) {};
  }

  if (verb == "sleep") {
    const auto duration = util::FromSeconds(ParseDuration(command, argument));
    return [duration](ExecutionContext& ctx) { ctx.Sleep(duration); };
  }

  if (verb == "spin") {
    const auto duration = util::FromSeconds(ParseDuration(command, argument));
    return [duration](ExecutionContext& ctx) {
      const auto deadline = util::Now() + duration;
      while (util::Now() < deadline) {
      }
      ctx.Checkpoint();
    };
  }

  if (verb == "raise" && !argument.empty()) {
    return [argument](ExecutionContext&) { throw CellError(argument, "cell raised " + argument); };
  }

  throw std::invalid_argument("Unknown cell command '" + std::string(command) + "'");
}

std::vector<ScriptCell> ParseCellScript(std::istream& in) {
  std::vector<ScriptCell> cells;
  std::string             raw;
  std::size_t             line = 0;

  while (std::getline(in, raw)) {
    ++line;
    const auto command = Trim(raw);
    if (command.empty() || command.front() == '#') continue;

    ScriptCell cell;
    cell.line          = line;
    cell.info.cell_id  = "cell-" + std::to_string(line);
    cell.info.raw_cell = std::string(command);
    try {
      cell.body = ParseCellCommand(command);
    } catch (const std::invalid_argument& e) {
      throw std::invalid_argument("line " + std::to_string(line) + ": " + e.what());
    }
    cells.push_back(std::move(cell));
  }

  return cells;
}

} // namespace execmon::kernel
