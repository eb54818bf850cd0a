#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "loopmux/logging/log_message.h"
#include "loopmux/logging/log_sink.h"

namespace loopmux {
namespace logging {

/**
 * Named logger writing synchronously to a shared sink.
 *
 * Formatting happens only after the level check passes.
 */
class Logger {
 public:
  explicit Logger(std::string name, LogLevel level = LogLevel::Info)
      : name_(std::move(name)), level_(level) {}

  const std::string& name() const { return name_; }

  LogLevel level() const { return level_.load(std::memory_order_relaxed); }
  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  bool shouldLog(LogLevel level) const {
    return level != LogLevel::Off && level >= this->level();
  }

  void setSink(LogSinkSharedPtr sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
  }

  template <typename... Args>
  void log(LogLevel level,
           const LogLocation& location,
           uint64_t client_id,
           const char* format,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.logger_name = name_;
    msg.text = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
    msg.location = location;
    msg.client_id = client_id;
    write(msg);
  }

  template <typename... Args>
  void log(LogLevel level, const char* format, Args&&... args) {
    log(level, LogLocation(), 0, format, std::forward<Args>(args)...);
  }

  void flush() {
    LogSinkSharedPtr sink = currentSink();
    if (sink) {
      sink->flush();
    }
  }

 private:
  LogSinkSharedPtr currentSink() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_;
  }

  void write(const LogMessage& msg) {
    LogSinkSharedPtr sink = currentSink();
    if (sink) {
      sink->write(msg);
    }
  }

  const std::string name_;
  std::atomic<LogLevel> level_;
  mutable std::mutex mutex_;
  LogSinkSharedPtr sink_;
};

using LoggerSharedPtr = std::shared_ptr<Logger>;

}  // namespace logging
}  // namespace loopmux
