#include "gateway/model_gateway.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace grok_mcp::gateway {
namespace {

constexpr std::size_t kMaxErrorBodyChars = 200;

std::string error_detail(const nlohmann::json& body) {
  if (!body.is_object()) {
    return {};
  }
  const auto error_it = body.find("error");
  if (error_it == body.end()) {
    return {};
  }
  if (error_it->is_string()) {
    return error_it->get<std::string>();
  }
  if (error_it->is_object()) {
    const auto message_it = error_it->find("message");
    if (message_it != error_it->end() && message_it->is_string()) {
      return message_it->get<std::string>();
    }
  }
  return {};
}

}  // namespace

std::string build_chat_completion_body(const CompletionRequest& request) {
  nlohmann::json j;
  j["model"] = request.model;
  j["stream"] = false;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : request.messages) {
    j["messages"].push_back({{"role", m.role}, {"content", m.content}});
  }
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<std::string> parse_chat_completion_response(const long http_status, const std::string& body,
                                                          std::string* err) {
  auto jr = nlohmann::json::parse(body, nullptr, false);

  if (http_status < 200 || http_status >= 300) {
    if (err) {
      std::string detail = jr.is_discarded() ? body.substr(0, kMaxErrorBodyChars) : error_detail(jr);
      *err = "http " + std::to_string(http_status);
      if (!detail.empty()) {
        *err += ": " + detail;
      }
    }
    return std::nullopt;
  }

  if (jr.is_discarded() || !jr.is_object() || !jr.contains("choices") || !jr["choices"].is_array() ||
      jr["choices"].empty() || !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") ||
      !jr["choices"][0]["message"].is_object() || !jr["choices"][0]["message"].contains("content") ||
      !jr["choices"][0]["message"]["content"].is_string()) {
    if (err) *err = "invalid json from /chat/completions";
    return std::nullopt;
  }

  return jr["choices"][0]["message"]["content"].get<std::string>();
}

}  // namespace grok_mcp::gateway
