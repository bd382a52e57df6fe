#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace inkvault::observability {
namespace {

std::string ResolveLevel(const inkvault::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("INKVAULT_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const inkvault::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("INKVAULT_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendQuoted(std::ostringstream& out, const std::string& value) {
  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out << '\\';
    out << c;
  }
  out << '"';
}

} // namespace

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    if (NeedsQuoting(field.value)) {
      AppendQuoted(out, field.value);
    } else {
      out << field.value;
    }
  }
  return out.str();
}

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField ImageField(std::string_view image_name) {
  return StringField("image", image_name);
}

LogField IndexField(std::string_view key, std::uint64_t index) {
  return {std::string(key), std::to_string(index)};
}

LogField ErrorField(std::string_view what) {
  return StringField("error", what);
}

LogField ElapsedField(std::string_view key, util::Duration elapsed) {
  return IntField(key, util::ToMillis(elapsed));
}

void InitializeLogging(const inkvault::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("inkvault");
  if (!logger) {
    logger = spdlog::stdout_color_mt("inkvault");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = FormatFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace inkvault::observability
