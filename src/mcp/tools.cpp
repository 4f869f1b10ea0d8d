#include "mcp/tools.hpp"

#include <algorithm>
#include <utility>

#include "mcp/prompts.hpp"

namespace grok_mcp::mcp {

namespace {

nlohmann::json text_property(const char* description, const std::size_t max_length) {
  return nlohmann::json{{"type", "string"}, {"description", description}, {"maxLength", max_length}};
}

std::vector<Tool> build_tools(const core::InputLimits& limits) {
  std::vector<Tool> tools;

  tools.push_back(Tool{.kind = ToolKind::server_info,
                       .name = "server_info",
                       .description = "Get server status and error information",
                       .input_schema = nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}},
                       .requires_gateway = false,
                       .handler = nullptr});

  tools.push_back(Tool{
      .kind = ToolKind::ask,
      .name = "ask",
      .description = "Ask Grok a question and get the response directly in Claude's context. Trigger: 'use grok', "
                     "'ask grok', or 'grok:' followed by a question.",
      .input_schema = nlohmann::json{{"type", "object"},
                                     {"properties",
                                      {{"prompt", text_property("The question or prompt for Grok",
                                                                limits.max_prompt_length)}}},
                                     {"required", nlohmann::json::array({"prompt"})}},
      .requires_gateway = true,
      .handler = nullptr});

  tools.push_back(Tool{
      .kind = ToolKind::code_review,
      .name = "code_review",
      .description = "Have Grok review code and return feedback directly to Claude. Trigger: 'grok review', 'grok "
                     "code review', or 'have grok review'.",
      .input_schema =
          nlohmann::json{{"type", "object"},
                         {"properties",
                          {{"code", text_property("The code to review", limits.max_code_length)},
                           {"focus",
                            {{"type", "string"},
                             {"description", "Specific focus area (security, performance, etc.)"},
                             {"maxLength", limits.max_focus_length},
                             {"default", kDefaultFocus}}}}},
                         {"required", nlohmann::json::array({"code"})}},
      .requires_gateway = true,
      .handler = nullptr});

  nlohmann::json context_property = text_property("Additional context", limits.max_prompt_length);
  context_property["default"] = "";
  tools.push_back(Tool{
      .kind = ToolKind::brainstorm,
      .name = "brainstorm",
      .description = "Brainstorm solutions with Grok, response visible to Claude. Trigger: 'grok brainstorm', "
                     "'brainstorm with grok', or 'grok ideas'.",
      .input_schema = nlohmann::json{{"type", "object"},
                                     {"properties",
                                      {{"topic", text_property("The topic to brainstorm about", limits.max_prompt_length)},
                                       {"context", context_property}}},
                                     {"required", nlohmann::json::array({"topic"})}},
      .requires_gateway = true,
      .handler = nullptr});

  return tools;
}

}  // namespace

std::optional<ToolKind> parse_tool_kind(const std::string_view name) noexcept {
  if (name == "server_info") {
    return ToolKind::server_info;
  }
  if (name == "ask") {
    return ToolKind::ask;
  }
  if (name == "code_review") {
    return ToolKind::code_review;
  }
  if (name == "brainstorm") {
    return ToolKind::brainstorm;
  }
  return std::nullopt;
}

ToolRegistry::ToolRegistry(core::StartupConfig startup, gateway::ModelGateway* gateway, const core::Logger* log)
    : startup_(std::move(startup)), gateway_(gateway), log_(log), tools_(build_tools(startup_.server.limits)) {
  for (auto& tool : tools_) {
    switch (tool.kind) {
      case ToolKind::server_info:
        tool.handler = &ToolRegistry::handle_server_info;
        break;
      case ToolKind::ask:
        tool.handler = &ToolRegistry::handle_ask;
        break;
      case ToolKind::code_review:
        tool.handler = &ToolRegistry::handle_code_review;
        break;
      case ToolKind::brainstorm:
        tool.handler = &ToolRegistry::handle_brainstorm;
        break;
    }
  }
}

bool ToolRegistry::gateway_available() const noexcept { return startup_.gateway_available && gateway_ != nullptr; }

std::vector<const Tool*> ToolRegistry::visible_tools() const {
  const bool available = gateway_available();
  std::vector<const Tool*> visible;
  for (const auto& tool : tools_) {
    if (tool.requires_gateway == available) {
      visible.push_back(&tool);
    }
  }
  return visible;
}

nlohmann::json ToolRegistry::list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto* tool : visible_tools()) {
    tools.push_back({{"name", tool->name}, {"description", tool->description}, {"inputSchema", tool->input_schema}});
  }
  return tools;
}

Outcome<std::string> ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) const {
  const auto kind = parse_tool_kind(name);
  const auto tool_it = std::find_if(tools_.begin(), tools_.end(),
                                    [&kind](const Tool& tool) { return kind.has_value() && tool.kind == *kind; });
  if (tool_it == tools_.end()) {
    return ToolError{ToolErrorCode::unknown_tool, "Unknown tool: " + name};
  }

  if (tool_it->requires_gateway && !gateway_available()) {
    return std::string("Grok not available: ") + startup_.gateway_error;
  }

  return (this->*(tool_it->handler))(arguments);
}

Outcome<std::string> ToolRegistry::handle_server_info(const nlohmann::json& /*arguments*/) const {
  std::string status = std::string("Server v") + core::kServerVersion;
  if (gateway_available()) {
    return status + " - Grok connected and ready! Model: " + startup_.server.model;
  }
  return status + " - Grok error: " + startup_.gateway_error;
}

Outcome<std::string> ToolRegistry::handle_ask(const nlohmann::json& arguments) const {
  auto prompt = required_text(arguments, "prompt", startup_.server.limits.max_prompt_length, log_);
  if (std::holds_alternative<ToolError>(prompt)) {
    return prompt;
  }
  return complete(std::get<std::string>(prompt), nullptr);
}

Outcome<std::string> ToolRegistry::handle_code_review(const nlohmann::json& arguments) const {
  const auto& limits = startup_.server.limits;
  auto code = required_text(arguments, "code", limits.max_code_length, log_);
  if (std::holds_alternative<ToolError>(code)) {
    return code;
  }

  auto focus = string_argument(arguments, "focus", kDefaultFocus);
  if (std::holds_alternative<ToolError>(focus)) {
    return focus;
  }

  const std::string prompt =
      build_code_review_prompt(std::get<std::string>(code), sanitize_focus(std::get<std::string>(focus), limits.max_focus_length));
  return complete(prompt, kCodeReviewSystemRole);
}

Outcome<std::string> ToolRegistry::handle_brainstorm(const nlohmann::json& arguments) const {
  const auto& limits = startup_.server.limits;
  auto topic = required_text(arguments, "topic", limits.max_prompt_length, log_);
  if (std::holds_alternative<ToolError>(topic)) {
    return topic;
  }

  auto context = string_argument(arguments, "context");
  if (std::holds_alternative<ToolError>(context)) {
    return context;
  }

  const std::string prompt = build_brainstorm_prompt(
      std::get<std::string>(topic), truncate_input(std::get<std::string>(context), limits.max_prompt_length, "context", log_));
  return complete(prompt, kBrainstormSystemRole);
}

std::string ToolRegistry::complete(const std::string& prompt, const char* system_role) const {
  gateway::CompletionRequest request{.model = startup_.server.model,
                                     .messages = {},
                                     .timeout = startup_.server.gateway.timeout};
  if (system_role != nullptr) {
    request.messages.push_back({"system", system_role});
  }
  request.messages.push_back({"user", prompt});

  std::string err;
  auto content = gateway_->complete(request, &err);
  if (!content) {
    std::string message = "Error calling Grok: " + (err.empty() ? std::string("unknown error") : err);
    if (log_ != nullptr) {
      log_->error(message);
    }
    return message;
  }
  return *content;
}

}  // namespace grok_mcp::mcp
