#include "loopmux/logging/log_level.h"

#include <cctype>

namespace loopmux {
namespace logging {

namespace {

struct LevelName {
  LogLevel level;
  const char* name;
};

constexpr LevelName kLevelNames[] = {
    {LogLevel::Debug, "DEBUG"},       {LogLevel::Info, "INFO"},
    {LogLevel::Notice, "NOTICE"},     {LogLevel::Warning, "WARNING"},
    {LogLevel::Error, "ERROR"},       {LogLevel::Critical, "CRITICAL"},
    {LogLevel::Alert, "ALERT"},       {LogLevel::Emergency, "EMERGENCY"},
    {LogLevel::Off, "OFF"},
};

}  // namespace

const char* logLevelName(LogLevel level) {
  for (const auto& entry : kLevelNames) {
    if (entry.level == level) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string upper;
  upper.reserve(name.size());
  for (char c : name) {
    upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (upper == "WARN") {
    return LogLevel::Warning;
  }
  for (const auto& entry : kLevelNames) {
    if (upper == entry.name) {
      return entry.level;
    }
  }
  return std::nullopt;
}

}  // namespace logging
}  // namespace loopmux
