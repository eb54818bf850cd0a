#define LOOPMUX_LOG_COMPONENT "config.server"

#include "loopmux/config/server_config.h"

#include <fstream>
#include <limits>
#include <regex>

#include "loopmux/logging/log_level.h"
#include "loopmux/logging/log_macros.h"

namespace loopmux {
namespace config {

namespace {

template <typename T>
void readField(const json& j,
               const char* key,
               const std::string& field,
               T& out) {
  if (!j.contains(key) || j[key].is_null()) {
    return;
  }
  try {
    out = j[key].get<T>();
  } catch (const json::exception& e) {
    throw ConfigValidationError(field, "Type error: " + std::string(e.what()));
  }
}

void readDuration(const json& j,
                  const char* key,
                  const std::string& field,
                  std::chrono::milliseconds& out) {
  if (!j.contains(key) || j[key].is_null()) {
    return;
  }
  auto parsed = Duration::parse(j[key]);
  if (!parsed.first) {
    throw ConfigValidationError(field, "Invalid duration: " + j[key].dump());
  }
  out = parsed.second;
}

bool isPath(const std::string& path) {
  return !path.empty() && path[0] == '/' &&
         path.find_first_of(" \t\r\n?") == std::string::npos;
}

}  // namespace

// Duration

std::pair<bool, std::chrono::milliseconds> Duration::parse(
    const std::string& str) {
  static const std::regex pattern("^([0-9]+)(ms|s|m|h)$");
  std::smatch match;

  if (!std::regex_match(str, match, pattern)) {
    LOOPMUX_LOG(Error,
                "Invalid duration format '{}'. Expected <number><unit> where "
                "unit is ms, s, m, or h",
                str);
    return {false, std::chrono::milliseconds(0)};
  }

  int64_t value;
  try {
    value = std::stoll(match[1].str());
  } catch (const std::out_of_range&) {
    LOOPMUX_LOG(Error, "Duration value out of range: {}", str);
    return {false, std::chrono::milliseconds(0)};
  }

  const std::string unit = match[2].str();
  int64_t multiplier = 1;
  if (unit == "s") {
    multiplier = 1000;
  } else if (unit == "m") {
    multiplier = 60 * 1000;
  } else if (unit == "h") {
    multiplier = 60 * 60 * 1000;
  }

  if (value > std::numeric_limits<int64_t>::max() / multiplier) {
    LOOPMUX_LOG(Error, "Duration value overflows: {}", str);
    return {false, std::chrono::milliseconds(0)};
  }
  return {true, std::chrono::milliseconds(value * multiplier)};
}

std::pair<bool, std::chrono::milliseconds> Duration::parse(const json& value) {
  if (value.is_string()) {
    return parse(value.get<std::string>());
  }

  if (value.is_number()) {
    // Bare numbers are milliseconds
    int64_t ms = value.is_number_integer()
                     ? value.get<int64_t>()
                     : static_cast<int64_t>(value.get<double>());
    if (ms < 0) {
      LOOPMUX_LOG(Error, "Duration values must be non-negative: {}", ms);
      return {false, std::chrono::milliseconds(0)};
    }
    return {true, std::chrono::milliseconds(ms)};
  }

  LOOPMUX_LOG(Error, "Invalid duration value type: expected string or number");
  return {false, std::chrono::milliseconds(0)};
}

std::string Duration::toString(std::chrono::milliseconds duration) {
  auto ms = duration.count();

  if (ms == 0)
    return "0ms";
  if (ms % (60 * 60 * 1000) == 0)
    return std::to_string(ms / (60 * 60 * 1000)) + "h";
  if (ms % (60 * 1000) == 0)
    return std::to_string(ms / (60 * 1000)) + "m";
  if (ms % 1000 == 0)
    return std::to_string(ms / 1000) + "s";
  return std::to_string(ms) + "ms";
}

// Validation

void PortRangeConfig::validate() const {
  if (min < 1 || min > 65535) {
    throw ConfigValidationError("port_range.min",
                                "Port must be between 1 and 65535");
  }
  if (max < 1 || max > 65535) {
    throw ConfigValidationError("port_range.max",
                                "Port must be between 1 and 65535");
  }
  if (min > max) {
    throw ConfigValidationError(
        "port_range", "Minimum port " + std::to_string(min) +
                          " is greater than maximum port " +
                          std::to_string(max));
  }
}

void SseConfig::validate() const {
  if (!isPath(path)) {
    throw ConfigValidationError("sse.path",
                                "Path must start with '/' and contain no "
                                "whitespace or query string");
  }
  if (!isPath(message_path)) {
    throw ConfigValidationError("sse.message_path",
                                "Path must start with '/' and contain no "
                                "whitespace or query string");
  }
  if (heartbeat_interval.count() <= 0) {
    throw ConfigValidationError("sse.heartbeat_interval",
                                "Heartbeat interval must be greater than 0");
  }
}

void ServerConfig::validate() const {
  port_range.validate();

  if (bind_address.empty()) {
    throw ConfigValidationError("bind_address", "Bind address cannot be empty");
  }

  if (listen_backlog <= 0) {
    throw ConfigValidationError("listen_backlog",
                                "Listen backlog must be greater than 0");
  }

  sse.validate();

  if (ping_interval.count() <= 0) {
    throw ConfigValidationError("ping_interval",
                                "Ping interval must be greater than 0");
  }

  if (auth_header.empty() ||
      auth_header.find_first_of(" \t\r\n:,") != std::string::npos) {
    throw ConfigValidationError("auth_header",
                                "Header name cannot be empty or contain "
                                "whitespace, ':' or ','");
  }

  if (!logging::parseLogLevel(log_level)) {
    throw ConfigValidationError("log_level",
                                "Unknown log level '" + log_level + "'");
  }
}

// JSON conversion

json ServerConfig::toJson() const {
  return json{
      {"port_range", {{"min", port_range.min}, {"max", port_range.max}}},
      {"bind_address", bind_address},
      {"listen_backlog", listen_backlog},
      {"sse",
       {{"enabled", sse.enabled},
        {"path", sse.path},
        {"message_path", sse.message_path},
        {"heartbeat_interval", Duration::toString(sse.heartbeat_interval)}}},
      {"ping_interval", Duration::toString(ping_interval)},
      {"auth_header", auth_header},
      {"log_level", log_level}};
}

ServerConfig ServerConfig::fromJson(const json& j) {
  if (!j.is_object()) {
    throw ConfigValidationError("root", "Configuration root must be an object");
  }

  ServerConfig config;

  if (j.contains("port_range") && j["port_range"].is_object()) {
    const auto& range = j["port_range"];
    readField(range, "min", "port_range.min", config.port_range.min);
    readField(range, "max", "port_range.max", config.port_range.max);
  }

  readField(j, "bind_address", "bind_address", config.bind_address);
  readField(j, "listen_backlog", "listen_backlog", config.listen_backlog);

  if (j.contains("sse") && j["sse"].is_object()) {
    const auto& sse = j["sse"];
    readField(sse, "enabled", "sse.enabled", config.sse.enabled);
    readField(sse, "path", "sse.path", config.sse.path);
    readField(sse, "message_path", "sse.message_path",
              config.sse.message_path);
    readDuration(sse, "heartbeat_interval", "sse.heartbeat_interval",
                 config.sse.heartbeat_interval);
  }

  readDuration(j, "ping_interval", "ping_interval", config.ping_interval);
  readField(j, "auth_header", "auth_header", config.auth_header);
  readField(j, "log_level", "log_level", config.log_level);

  return config;
}

ServerConfig loadServerConfigFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigParseError("Cannot open configuration file: " + path);
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error& e) {
    throw ConfigParseError("Invalid JSON in " + path + ": " + e.what());
  }

  ServerConfig config = ServerConfig::fromJson(j);
  config.validate();
  LOOPMUX_LOG(Info, "loaded configuration from {}", path);
  return config;
}

}  // namespace config
}  // namespace loopmux
