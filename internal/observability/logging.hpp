#pragma once

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace execmon::runtime::config {
class RuntimeConfig;
}

namespace execmon::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Renders "<value with `precision` decimals>s", e.g. "12.34s".
LogField SecondsField(std::string_view key, double seconds, int precision = 2);

void InitializeLogging(const execmon::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

/*
  Named logger sharing the default logger's sinks, level and pattern.

  Components take one of these at construction instead of logging through
  the process-wide default.
*/
std::shared_ptr<spdlog::logger> GetLogger(const std::string& name);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

/*
  Pipe-delimited event line, the grep-able format of lifecycle logs:

    EXEC_START | count=3 | cell_id=abc | preview=print(1)
*/
std::string FormatEvent(std::string_view event, std::initializer_list<LogField> fields);

void LogEvent(spdlog::logger& logger, spdlog::level::level_enum level, std::string_view event,
              std::initializer_list<LogField> fields);

// Escapes newlines so a source snippet stays on one log line.
std::string EscapeNewlines(std::string_view text);

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace execmon::observability

#define EXECMON_LOG_INFO(message, ...) ::execmon::observability::LogInfo((message), ##__VA_ARGS__)
#define EXECMON_LOG_WARN(message, ...) ::execmon::observability::LogWarn((message), ##__VA_ARGS__)
#define EXECMON_LOG_ERROR(message, ...) ::execmon::observability::LogError((message), ##__VA_ARGS__)
