#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace lipsync::observability {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v";

std::string ResolveLevel(const lipsync::runtime::config::LoggingConfig& config) {
  if (const char* level = std::getenv("LIPSYNC_LOG_LEVEL")) {
    return level;
  }

  if (!config.level().empty()) {
    return config.level();
  }

  return "info";
}

std::string ResolvePattern(const lipsync::runtime::config::LoggingConfig& config) {
  if (const char* pattern = std::getenv("LIPSYNC_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.pattern().empty()) {
    return config.pattern();
  }

  return kDefaultPattern;
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

std::shared_ptr<spdlog::logger> NullLogger() {
  static auto logger = std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
  return logger;
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

Logger::Logger() : impl_(NullLogger()) {
}

Logger::Logger(std::shared_ptr<spdlog::logger> impl) : impl_(impl ? std::move(impl) : NullLogger()) {
}

void Logger::Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) const {
  if (!impl_->should_log(level)) {
    return;
  }

  auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    impl_->log(level, "{} {}", message, serialized_fields);
    return;
  }
  impl_->log(level, "{}", message);
}

Logger Logger::WithName(std::string_view name) const {
  auto child = impl_->clone(std::string(name));
  return Logger(std::move(child));
}

Logger InitializeLogging(const lipsync::runtime::config::LoggingConfig& config, std::string_view name) {
  auto logger = spdlog::stderr_color_mt(std::string(name));
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  logger->flush_on(spdlog::level::warn);
  return Logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

} // namespace lipsync::observability
