#pragma once

#include "loopmux/logging/logger_registry.h"

// Define before including:  #define LOOPMUX_LOG_COMPONENT "server.sse"
#ifndef LOOPMUX_LOG_COMPONENT
#define LOOPMUX_LOG_COMPONENT "loopmux"
#endif

#ifdef LOOPMUX_LOG_DISABLE
#define LOOPMUX_CLIENT_LOG(level, client_id, ...) ((void)0)
#else
#define LOOPMUX_CLIENT_LOG(level, client_id, ...)                          \
  do {                                                                     \
    auto& loopmux_registry_ = ::loopmux::logging::LoggerRegistry::instance(); \
    if (loopmux_registry_.shouldLog(LOOPMUX_LOG_COMPONENT,                 \
                                    ::loopmux::logging::LogLevel::level)) { \
      loopmux_registry_.getOrCreateLogger(LOOPMUX_LOG_COMPONENT)           \
          ->log(::loopmux::logging::LogLevel::level,                       \
                ::loopmux::logging::LogLocation{__FILE__, __LINE__,        \
                                                __func__},                 \
                (client_id), __VA_ARGS__);                                 \
    }                                                                      \
  } while (0)
#endif

// LOOPMUX_LOG(Warning, "bind failed on port {}", port)
#define LOOPMUX_LOG(level, ...) LOOPMUX_CLIENT_LOG(level, 0, __VA_ARGS__)
