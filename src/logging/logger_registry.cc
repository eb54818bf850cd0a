#include "loopmux/logging/logger_registry.h"

#include <fnmatch.h>

namespace loopmux {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry registry;
  return registry;
}

LoggerRegistry::LoggerRegistry()
    : default_sink_(std::make_shared<StdioSink>()) {}

LoggerSharedPtr LoggerRegistry::getOrCreateLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  LoggerSharedPtr& logger = loggers_[name];
  if (!logger) {
    logger = std::make_shared<Logger>(name, levelForLocked(name));
    logger->setSink(default_sink_);
  }
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  refreshLevelsLocked();
}

LogLevel LoggerRegistry::globalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setPattern(const std::string& glob, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(glob, level);
  refreshLevelsLocked();
}

void LoggerRegistry::clearPatterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  refreshLevelsLocked();
}

void LoggerRegistry::setDefaultSink(LogSinkSharedPtr sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  return level != LogLevel::Off && level >= getEffectiveLevel(name);
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  return it != loggers_.end() ? it->second->level() : levelForLocked(name);
}

LogLevel LoggerRegistry::levelForLocked(const std::string& name) const {
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (fnmatch(it->first.c_str(), name.c_str(), 0) == 0) {
      return it->second;
    }
  }
  return global_level_;
}

void LoggerRegistry::refreshLevelsLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(levelForLocked(entry.first));
  }
}

}  // namespace logging
}  // namespace loopmux
