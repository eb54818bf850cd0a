#ifndef LOOPMUX_CONFIG_SERVER_CONFIG_H
#define LOOPMUX_CONFIG_SERVER_CONFIG_H

#include <chrono>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "loopmux/json.h"

namespace loopmux {
namespace config {

class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& field, const std::string& reason)
      : std::runtime_error(formatError(field, reason)),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  static std::string formatError(const std::string& field,
                                 const std::string& reason) {
    std::ostringstream oss;
    oss << "Configuration validation failed for field '" << field
        << "': " << reason;
    return oss.str();
  }

  std::string field_;
  std::string reason_;
};

class ConfigParseError : public std::runtime_error {
 public:
  explicit ConfigParseError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Duration values accept integer milliseconds or "<n>ms|s|m|h" strings.
 */
class Duration {
 public:
  static std::pair<bool, std::chrono::milliseconds> parse(
      const std::string& str);
  static std::pair<bool, std::chrono::milliseconds> parse(const json& value);
  static std::string toString(std::chrono::milliseconds duration);
};

struct PortRangeConfig {
  int min = 10000;
  int max = 65535;

  void validate() const;
};

struct SseConfig {
  bool enabled = true;

  /// Path serving the event stream; also accepted for JSON-RPC POSTs
  std::string path = "/mcp";

  /// Path advertised in the endpoint event
  std::string message_path = "/messages";

  std::chrono::milliseconds heartbeat_interval{30000};

  void validate() const;
};

struct ServerConfig {
  PortRangeConfig port_range;

  /// Loopback only; the server is not meant to be reachable remotely
  std::string bind_address = "127.0.0.1";

  int listen_backlog = 128;

  SseConfig sse;

  /// WebSocket keepalive ping period
  std::chrono::milliseconds ping_interval{30000};

  /// Auth header name listed in the CORS allow-headers set
  std::string auth_header = "X-Claude-Code-IDE-Authorization";

  std::string log_level = "info";

  /**
   * @brief Validate server configuration
   * @throws ConfigValidationError on the first invalid field
   */
  void validate() const;

  json toJson() const;

  /**
   * @brief Build from JSON, keeping defaults for absent keys
   * @throws ConfigValidationError on type errors or malformed durations
   */
  static ServerConfig fromJson(const json& j);
};

/**
 * @brief Read, parse and validate a JSON configuration file
 * @throws ConfigParseError when the file is unreadable or not JSON
 * @throws ConfigValidationError when a value is invalid
 */
ServerConfig loadServerConfigFile(const std::string& path);

}  // namespace config
}  // namespace loopmux

#endif  // LOOPMUX_CONFIG_SERVER_CONFIG_H
