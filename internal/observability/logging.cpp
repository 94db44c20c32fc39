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

namespace cpandb::observability {
namespace {

constexpr const char* kLoggerName = "cpandb-generator";

std::string ResolveLevel(const cpandb::runtime::config::LoggingConfig& config) {
  if (const char* level = std::getenv("CPANDB_LOG_LEVEL")) {
    return level;
  }
  return config.level().empty() ? "info" : config.level();
}

std::string ResolvePattern(const cpandb::runtime::config::LoggingConfig& config) {
  if (const char* pattern = std::getenv("CPANDB_LOG_PATTERN")) {
    return pattern;
  }
  return config.pattern().empty() ? "[%Y-%m-%d %H:%M:%S] [%^%l%$] %v" : config.pattern();
}

// key=value, or key="value" when the value has spaces or quotes
void AppendField(std::ostringstream& out, const LogField& field) {
  out << field.key << '=';
  if (field.value.find_first_of(" \t\"=") == std::string::npos && !field.value.empty()) {
    out << field.value;
    return;
  }
  out << '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') out << '\\';
    out << c;
  }
  out << '"';
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    AppendField(out, field);
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

void InitializeLogging(const cpandb::runtime::config::LoggingConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!config.file().empty()) {
    // append: one file collects the history of scheduled runs
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file(), false));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  logger->flush_on(spdlog::level::warn);

  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
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

} // namespace cpandb::observability
