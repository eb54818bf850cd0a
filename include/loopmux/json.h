#ifndef LOOPMUX_JSON_H
#define LOOPMUX_JSON_H

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace loopmux {

using json = nlohmann::json;

// JSON-RPC error codes as constants
namespace jsonrpc {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
// Implementation-defined: the transport cannot honor the request
constexpr int TRANSPORT_UNSUPPORTED = -32000;

constexpr const char* VERSION = "2.0";
}  // namespace jsonrpc

struct Error {
  int code{0};
  std::string message;
  std::optional<json> data;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
  Error(int c, const std::string& m, json d)
      : code(c), message(m), data(std::move(d)) {}
};

void to_json(json& j, const Error& err);
void from_json(const json& j, Error& err);

namespace jsonrpc {

// {"jsonrpc":"2.0","id":...,"result":...}; "id" omitted when id is null
json makeResult(const json& id, const json& result);

// {"jsonrpc":"2.0","id":...,"error":{...}}; "id" omitted when id is null
json makeError(const json& id, const Error& error);

// {"jsonrpc":"2.0","method":...,"params":...}
json makeNotification(const std::string& method, const json& params);

}  // namespace jsonrpc

}  // namespace loopmux

#endif  // LOOPMUX_JSON_H
