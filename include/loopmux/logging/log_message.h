#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "loopmux/logging/log_level.h"

namespace loopmux {
namespace logging {

struct LogLocation {
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};
};

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string logger_name;
  std::string text;
  LogLocation location;

  // Server connection the line is about; 0 when none
  uint64_t client_id{0};

  std::chrono::system_clock::time_point timestamp{
      std::chrono::system_clock::now()};
  std::thread::id thread_id{std::this_thread::get_id()};
};

}  // namespace logging
}  // namespace loopmux
