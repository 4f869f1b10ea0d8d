#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace grok_mcp::mcp {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;

enum class Method {
  initialize,
  tools_list,
  tools_call,
  resources_list,
  prompts_list,
  notification_initialized,
  notification_cancelled,
  unknown,
};

Method parse_method(std::string_view name) noexcept;
bool is_notification_method(Method method) noexcept;

struct JsonRpcError {
  int code;
  std::string message;
};

struct JsonRpcRequest {
  std::string method_name;
  Method method{Method::unknown};
  nlohmann::json params;
  std::optional<nlohmann::json> id;
};

// Returns std::nullopt for values that cannot be answered: non-objects and ids that are not string, number or null.
std::optional<JsonRpcRequest> parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

// One line, newline terminated. Invalid UTF-8 is replaced rather than thrown on.
std::string encode_line(const nlohmann::json& message);

}  // namespace grok_mcp::mcp
