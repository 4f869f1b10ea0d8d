#pragma once

#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

#include "core/log.hpp"
#include "core/run_state.hpp"
#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace grok_mcp::mcp {

inline constexpr const char* kToolResponseLabel = "GROK RESPONSE:\n\n";

class Server {
 public:
  Server(ToolRegistry tools, const core::Logger& log);

  // Reads one JSON-RPC message per line until end of input or a stop signal, writing one response line per request.
  int run(std::istream& in, std::ostream& out, core::RunState& state) const;

  void process_line(const std::string& line, std::ostream& out, core::RunState& state) const;

 private:
  nlohmann::json dispatch(const JsonRpcRequest& request) const;
  void handle_notification(const JsonRpcRequest& request) const;
  nlohmann::json handle_initialize() const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params) const;
  void write_line(std::ostream& out, const std::string& line, core::RunState& state) const;

  ToolRegistry tools_;
  const core::Logger& log_;
};

}  // namespace grok_mcp::mcp
