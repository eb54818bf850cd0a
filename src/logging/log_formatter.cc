#include "loopmux/logging/log_formatter.h"

#include <cstring>
#include <ctime>

#include <fmt/format.h>

namespace loopmux {
namespace logging {

namespace {

std::string timestampText(std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          when.time_since_epoch())
                          .count() %
                      1000;
  std::tm local;
  localtime_r(&seconds, &local);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
  return fmt::format("{}.{:03}", buffer, millis);
}

const char* baseName(const char* path) {
  const char* slash = std::strrchr(path, '/');
  return slash ? slash + 1 : path;
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  fmt::format_to(std::back_inserter(out), "[{}] [{}] [{}] ",
                 timestampText(msg.timestamp), logLevelName(msg.level),
                 msg.logger_name);
  if (msg.client_id != 0) {
    fmt::format_to(std::back_inserter(out), "[client:{}] ", msg.client_id);
  }
  if (msg.location.file && msg.location.line > 0 &&
      msg.level >= LogLevel::Warning) {
    fmt::format_to(std::back_inserter(out), "[{}:{}] ",
                   baseName(msg.location.file), msg.location.line);
  }
  out.append(msg.text.data(), msg.text.data() + msg.text.size());
  return fmt::to_string(out);
}

}  // namespace logging
}  // namespace loopmux
