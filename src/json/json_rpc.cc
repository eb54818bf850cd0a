#include "loopmux/json.h"

namespace loopmux {

void to_json(json& j, const Error& err) {
  j = json{{"code", err.code}, {"message", err.message}};
  if (err.data.has_value()) {
    j["data"] = *err.data;
  }
}

void from_json(const json& j, Error& err) {
  j.at("code").get_to(err.code);
  j.at("message").get_to(err.message);
  if (j.contains("data")) {
    err.data = j.at("data");
  } else {
    err.data.reset();
  }
}

namespace jsonrpc {

json makeResult(const json& id, const json& result) {
  json response = {{"jsonrpc", VERSION}};
  if (!id.is_null()) {
    response["id"] = id;
  }
  response["result"] = result;
  return response;
}

json makeError(const json& id, const Error& error) {
  json response = {{"jsonrpc", VERSION}};
  if (!id.is_null()) {
    response["id"] = id;
  }
  response["error"] = error;
  return response;
}

json makeNotification(const std::string& method, const json& params) {
  return json{{"jsonrpc", VERSION},
              {"method", method},
              {"params", params.is_null() ? json::object() : params}};
}

}  // namespace jsonrpc
}  // namespace loopmux
