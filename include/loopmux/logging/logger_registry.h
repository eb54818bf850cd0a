#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "loopmux/logging/logger.h"

namespace loopmux {
namespace logging {

/**
 * Process-wide set of component loggers.
 *
 * A logger's level is the level of the last matching glob pattern
 * ("server.*", "http.rout?r"), or the global level when none matches. All
 * loggers write to the registry's default sink.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  LoggerSharedPtr getOrCreateLogger(const std::string& name);

  void setGlobalLevel(LogLevel level);
  LogLevel globalLevel() const;

  void setPattern(const std::string& glob, LogLevel level);
  void clearPatterns();

  void setDefaultSink(LogSinkSharedPtr sink);

  bool shouldLog(const std::string& name, LogLevel level);
  LogLevel getEffectiveLevel(const std::string& name);

 private:
  LoggerRegistry();

  LogLevel levelForLocked(const std::string& name) const;
  void refreshLevelsLocked();

  mutable std::mutex mutex_;
  std::map<std::string, LoggerSharedPtr> loggers_;
  std::vector<std::pair<std::string, LogLevel>> patterns_;
  LogLevel global_level_{LogLevel::Info};
  LogSinkSharedPtr default_sink_;
};

}  // namespace logging
}  // namespace loopmux
