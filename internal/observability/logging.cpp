#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "durable/v1/id.pb.h"

namespace durable::observability {
namespace {

constexpr const char* kLoggerName = "durable-flow";

std::string ResolveLevel(const durable::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("DURABLE_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const durable::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("DURABLE_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

std::string ResolveFile(const durable::runtime::config::RuntimeConfig& config) {
  if (const char* file = std::getenv("DURABLE_LOG_FILE")) {
    return file;
  }
  return config.logging().file();
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
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

LogField RunIdField(const durable::v1::RunID& run_id) {
  return {"run_id", run_id.value()};
}

void InitializeLogging(const durable::runtime::config::RuntimeConfig& config) {
  // Re-initialization (tests, embedded use) replaces the previous logger.
  spdlog::drop(kLoggerName);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (const auto file = ResolveFile(config); !file.empty()) {
    // throws spdlog::spdlog_ex if the file cannot be opened
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  spdlog::register_logger(logger);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace durable::observability
