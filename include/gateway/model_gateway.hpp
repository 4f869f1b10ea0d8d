#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace grok_mcp::gateway {

struct ChatMessage {
  std::string role;
  std::string content;
};

struct CompletionRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::chrono::seconds timeout{120};
};

class ModelGateway {
 public:
  virtual ~ModelGateway() = default;

  // Returns the assistant text, or std::nullopt with a description of the failure in *err.
  virtual std::optional<std::string> complete(const CompletionRequest& request, std::string* err) = 0;
};

std::string build_chat_completion_body(const CompletionRequest& request);

std::optional<std::string> parse_chat_completion_response(long http_status, const std::string& body,
                                                          std::string* err);

}  // namespace grok_mcp::gateway
