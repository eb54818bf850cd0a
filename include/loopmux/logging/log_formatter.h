#pragma once

#include <string>

#include "loopmux/logging/log_message.h"

namespace loopmux {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

/**
 * "[2024-05-01 12:00:00.123] [WARNING] [server.sse] [client:3] [file.cc:42]
 * text"
 *
 * The client tag appears only for client-scoped lines, the location only for
 * Warning and above.
 */
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

class MessageOnlyFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override { return msg.text; }
};

}  // namespace logging
}  // namespace loopmux
