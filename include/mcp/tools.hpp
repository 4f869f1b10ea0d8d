#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/log.hpp"
#include "gateway/model_gateway.hpp"
#include "mcp/validation.hpp"

namespace grok_mcp::mcp {

enum class ToolKind { server_info, ask, code_review, brainstorm };

std::optional<ToolKind> parse_tool_kind(std::string_view name) noexcept;

class ToolRegistry;

struct Tool {
  using Handler = Outcome<std::string> (ToolRegistry::*)(const nlohmann::json&) const;

  ToolKind kind;
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  bool requires_gateway;
  Handler handler;
};

class ToolRegistry {
 public:
  // gateway may be null; the registry then serves the degraded tool set.
  ToolRegistry(core::StartupConfig startup, gateway::ModelGateway* gateway, const core::Logger* log = nullptr);

  [[nodiscard]] bool gateway_available() const noexcept;

  // Tools advertised by tools/list for the current gateway state.
  [[nodiscard]] std::vector<const Tool*> visible_tools() const;
  [[nodiscard]] nlohmann::json list() const;

  [[nodiscard]] Outcome<std::string> call(const std::string& name, const nlohmann::json& arguments) const;

  [[nodiscard]] const core::StartupConfig& startup() const noexcept { return startup_; }

 private:
  Outcome<std::string> handle_server_info(const nlohmann::json& arguments) const;
  Outcome<std::string> handle_ask(const nlohmann::json& arguments) const;
  Outcome<std::string> handle_code_review(const nlohmann::json& arguments) const;
  Outcome<std::string> handle_brainstorm(const nlohmann::json& arguments) const;

  std::string complete(const std::string& prompt, const char* system_role) const;

  core::StartupConfig startup_;
  gateway::ModelGateway* gateway_;
  const core::Logger* log_;
  std::vector<Tool> tools_;
};

}  // namespace grok_mcp::mcp
