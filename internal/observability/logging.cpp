#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace execmon::observability {
namespace {

constexpr const char* kDefaultLoggerName = "execmon";

std::string ResolveLevel(const execmon::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("EXECMON_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const execmon::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("EXECMON_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField SecondsField(std::string_view key, double seconds, int precision) {
  return {std::string(key), fmt::format("{:.{}f}s", seconds, precision)};
}

void InitializeLogging(const execmon::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kDefaultLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kDefaultLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> GetLogger(const std::string& name) {
  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  auto parent = spdlog::default_logger();
  auto logger = std::make_shared<spdlog::logger>(name, parent->sinks().begin(), parent->sinks().end());
  logger->set_level(parent->level());
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  return logger;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  Log(*spdlog::default_logger(), level, message, fields);
}

void Log(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    logger.log(level, "{} {}", message, serialized_fields);
    return;
  }
  logger.log(level, "{}", message);
}

std::string FormatEvent(std::string_view event, std::initializer_list<LogField> fields) {
  std::string line(event);
  for (const auto& field : fields) {
    line.append(" | ");
    line.append(field.key);
    line.push_back('=');
    line.append(field.value);
  }
  return line;
}

void LogEvent(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view event,
              std::initializer_list<LogField> fields) {
  logger.log(level, "{}", FormatEvent(event, fields));
}

std::string EscapeNewlines(std::string_view text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    if (c == '\n') {
      escaped.append("\\n");
    } else {
      escaped.push_back(c);
    }
  }
  return escaped;
}

} // namespace execmon::observability
