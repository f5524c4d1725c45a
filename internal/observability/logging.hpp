#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

namespace lipsync::runtime::config {
class LoggingConfig;
}

namespace lipsync::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Logger

  Thin handle over an spdlog logger. Components receive one at construction
  instead of reaching for a process-wide default; copies share the sink.
*/
class Logger {
 public:
  // Discards everything; used when a component is built without logging.
  Logger();
  explicit Logger(std::shared_ptr<spdlog::logger> impl);

  void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {}) const;

  void Debug(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::debug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::info, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::warn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::err, message, fields);
  }

  // Child logger sharing sinks and level, tagged with a component name.
  Logger WithName(std::string_view name) const;

 private:
  std::shared_ptr<spdlog::logger> impl_;
};

// Builds the root logger for a process, writing to stderr. Honours
// LIPSYNC_LOG_LEVEL and LIPSYNC_LOG_PATTERN over the config values.
Logger InitializeLogging(const lipsync::runtime::config::LoggingConfig& config, std::string_view name);
void   ShutdownLogging();

} // namespace lipsync::observability

#define LIPSYNC_LOG_DEBUG(logger, message, ...) (logger).Debug((message), ##__VA_ARGS__)
#define LIPSYNC_LOG_INFO(logger, message, ...) (logger).Info((message), ##__VA_ARGS__)
#define LIPSYNC_LOG_WARN(logger, message, ...) (logger).Warn((message), ##__VA_ARGS__)
#define LIPSYNC_LOG_ERROR(logger, message, ...) (logger).Error((message), ##__VA_ARGS__)
