#pragma once

#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>

#include "loopmux/logging/log_formatter.h"

namespace loopmux {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void write(const LogMessage& msg) = 0;
  virtual void flush() {}

  void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::string render(const LogMessage& msg) const {
    return formatter_->format(msg);
  }

 private:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

using LogSinkSharedPtr = std::shared_ptr<LogSink>;

// One line per message on stderr (default) or stdout
class StdioSink : public LogSink {
 public:
  explicit StdioSink(FILE* stream = stderr) : stream_(stream) {}

  void write(const LogMessage& msg) override {
    std::string line = render(msg);
    line += '\n';
    std::lock_guard<std::mutex> lock(mutex_);
    std::fwrite(line.data(), 1, line.size(), stream_);
  }

  void flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stream_);
  }

 private:
  FILE* stream_;
  std::mutex mutex_;
};

class NullSink : public LogSink {
 public:
  void write(const LogMessage&) override {}
};

// Hands rendered lines to the embedding application
class ExternalSink : public LogSink {
 public:
  using Callback = std::function<void(
      LogLevel level, const std::string& logger, const std::string& line)>;

  explicit ExternalSink(Callback callback) : callback_(std::move(callback)) {}

  void write(const LogMessage& msg) override {
    if (callback_) {
      callback_(msg.level, msg.logger_name, render(msg));
    }
  }

 private:
  Callback callback_;
};

}  // namespace logging
}  // namespace loopmux
