#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace loopmux {
namespace logging {

// Syslog severities in ascending order; Off silences a logger
enum class LogLevel : uint8_t {
  Debug,
  Info,
  Notice,
  Warning,
  Error,
  Critical,
  Alert,
  Emergency,
  Off
};

const char* logLevelName(LogLevel level);

// Case-insensitive; also accepts "warn". nullopt for anything else.
std::optional<LogLevel> parseLogLevel(const std::string& name);

}  // namespace logging
}  // namespace loopmux
