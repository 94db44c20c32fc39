#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cpandb::runtime::config {
class LoggingConfig;
}

namespace cpandb::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Messages are "<message> key=value key=value"; values with spaces or
  quotes are quoted. Level and pattern come from config unless
  CPANDB_LOG_LEVEL / CPANDB_LOG_PATTERN are set. Calling it again
  replaces the previous logger.
*/
void InitializeLogging(const cpandb::runtime::config::LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace cpandb::observability

#define CPANDB_LOG_DEBUG(message, ...) ::cpandb::observability::LogDebug((message), ##__VA_ARGS__)
#define CPANDB_LOG_INFO(message, ...) ::cpandb::observability::LogInfo((message), ##__VA_ARGS__)
#define CPANDB_LOG_WARN(message, ...) ::cpandb::observability::LogWarn((message), ##__VA_ARGS__)
#define CPANDB_LOG_ERROR(message, ...) ::cpandb::observability::LogError((message), ##__VA_ARGS__)
