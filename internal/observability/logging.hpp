#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace inkvault::runtime::config {
class RuntimeConfig;
}

namespace inkvault::observability {

/*
  Session logging.

  One spdlog logger ("inkvault") for the whole process. Every line is a
  short message followed by key=value fields so per-image activity can be
  grepped out of a shared log:

      snapshot saved image=slide_07 index=47

  Values containing spaces, quotes or '=' are double quoted.
  Level and pattern come from config, overridden by INKVAULT_LOG_LEVEL and
  INKVAULT_LOG_PATTERN.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Common session fields.
LogField ImageField(std::string_view image_name);
LogField IndexField(std::string_view key, std::uint64_t index);
LogField ErrorField(std::string_view what);
LogField ElapsedField(std::string_view key, util::Duration elapsed); // in ms

std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const inkvault::runtime::config::RuntimeConfig& config);
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

} // namespace inkvault::observability

#define INKVAULT_LOG_DEBUG(message, ...) ::inkvault::observability::LogDebug((message), ##__VA_ARGS__)
#define INKVAULT_LOG_INFO(message, ...) ::inkvault::observability::LogInfo((message), ##__VA_ARGS__)
#define INKVAULT_LOG_WARN(message, ...) ::inkvault::observability::LogWarn((message), ##__VA_ARGS__)
#define INKVAULT_LOG_ERROR(message, ...) ::inkvault::observability::LogError((message), ##__VA_ARGS__)
