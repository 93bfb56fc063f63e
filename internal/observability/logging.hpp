#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace cdn::runtime::config {
class RuntimeConfig;
}

namespace cdn::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// Installs the "cdn-manager" stderr logger as spdlog's default.
void InitializeLogging(const cdn::runtime::config::RuntimeConfig& config);
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

} // namespace cdn::observability

#define CDN_LOG_INFO(message, ...) ::cdn::observability::LogInfo((message), ##__VA_ARGS__)
#define CDN_LOG_WARN(message, ...) ::cdn::observability::LogWarn((message), ##__VA_ARGS__)
#define CDN_LOG_ERROR(message, ...) ::cdn::observability::LogError((message), ##__VA_ARGS__)
