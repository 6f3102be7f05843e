#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace lifebank::runtime::config {
class RuntimeConfig;
}

namespace lifebank::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField UintField(std::string_view key, std::uint64_t value);

void InitializeLogging(const lifebank::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace lifebank::observability

#define LIFEBANK_LOG_INFO(message, ...) ::lifebank::observability::LogInfo((message), ##__VA_ARGS__)
#define LIFEBANK_LOG_WARN(message, ...) ::lifebank::observability::LogWarn((message), ##__VA_ARGS__)
#define LIFEBANK_LOG_ERROR(message, ...) ::lifebank::observability::LogError((message), ##__VA_ARGS__)
