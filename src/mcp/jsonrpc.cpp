#include "mcp/jsonrpc.hpp"

namespace grok_mcp::mcp {

namespace {

bool valid_id(const nlohmann::json& id) { return id.is_null() || id.is_string() || id.is_number(); }

}  // namespace

Method parse_method(const std::string_view name) noexcept {
  if (name == "initialize") {
    return Method::initialize;
  }
  if (name == "tools/list") {
    return Method::tools_list;
  }
  if (name == "tools/call") {
    return Method::tools_call;
  }
  if (name == "resources/list") {
    return Method::resources_list;
  }
  if (name == "prompts/list") {
    return Method::prompts_list;
  }
  if (name == "notifications/initialized") {
    return Method::notification_initialized;
  }
  if (name == "notifications/cancelled") {
    return Method::notification_cancelled;
  }
  return Method::unknown;
}

bool is_notification_method(const Method method) noexcept {
  return method == Method::notification_initialized || method == Method::notification_cancelled;
}

std::optional<JsonRpcRequest> parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest parsed{.method_name = {}, .method = Method::unknown, .params = nlohmann::json::object(), .id = std::nullopt};

  const auto method_it = request.find("method");
  if (method_it != request.end() && method_it->is_string()) {
    parsed.method_name = method_it->get<std::string>();
    parsed.method = parse_method(parsed.method_name);
  }

  const auto params_it = request.find("params");
  if (params_it != request.end() && params_it->is_object()) {
    parsed.params = *params_it;
  }

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    if (!valid_id(*id_it)) {
      return std::nullopt;
    }
    parsed.id = *id_it;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

std::string encode_line(const nlohmann::json& message) {
  std::string line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  line.push_back('\n');
  return line;
}

}  // namespace grok_mcp::mcp
