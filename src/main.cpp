#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "cli/config_command.hpp"
#include "core/config.hpp"
#include "core/log.hpp"
#include "core/run_state.hpp"
#include "gateway/curl_gateway.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

void print_usage(std::ostream& out) {
  out << "Grok MCP server for Claude Code\n\n";
  out << "Usage:\n";
  out << "  grok-mcp                                Run as MCP server (JSON-RPC over stdio)\n";
  out << "  grok-mcp config --model <model>         Set default model\n";
  out << "  grok-mcp config --show                  Show current config\n";
  out << "  grok-mcp config --list-models           List available models\n";
  out << "  grok-mcp --version                      Print version\n";
}

std::string format_startup_settings(const grok_mcp::core::StartupConfig& startup) {
  std::ostringstream output;
  output << "Starting " << grok_mcp::core::kServerName << " v" << grok_mcp::core::kServerVersion
         << " | model=" << startup.server.model << " | endpoint=" << startup.server.gateway.base_url
         << " | timeout_s=" << startup.server.gateway.timeout.count()
         << " | grok_available=" << (startup.gateway_available ? "true" : "false");
  return output.str();
}

int run_server() {
  const auto config_path = grok_mcp::core::default_config_path();

  grok_mcp::core::StartupConfig startup{};
  try {
    startup.server = grok_mcp::core::load_server_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  const grok_mcp::core::Logger log(std::cerr, startup.server.log_level);

  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  std::unique_ptr<grok_mcp::gateway::CurlModelGateway> gateway;
  if (startup.server.gateway.api_key.empty()) {
    startup.gateway_error = std::string(grok_mcp::core::kApiKeyEnv) + " environment variable is not set";
    log.error(startup.gateway_error);
  } else {
    try {
      gateway = std::make_unique<grok_mcp::gateway::CurlModelGateway>(startup.server.gateway);
      startup.gateway_available = true;
      log.info("Grok client initialized successfully with model: " + startup.server.model);
    } catch (const std::exception& ex) {
      startup.gateway_error = ex.what();
      log.error("Failed to initialize Grok client: " + startup.gateway_error);
    }
  }

  log.info(format_startup_settings(startup));
  if (!startup.gateway_available) {
    log.warning("Grok initialization failed: " + startup.gateway_error);
  }

  const grok_mcp::mcp::Server server(grok_mcp::mcp::ToolRegistry(startup, gateway.get(), &log), log);
  grok_mcp::core::RunState state(&g_shutdown_requested);
  return server.run(std::cin, std::cout, state);
}

}  // namespace

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);

  if (args.empty()) {
    return run_server();
  }

  if (args.front() == "config") {
    return grok_mcp::cli::run_config_command(std::vector<std::string>(args.begin() + 1, args.end()),
                                             grok_mcp::core::default_config_path(), std::cout, std::cerr);
  }

  if (args.front() == "--help" || args.front() == "-h") {
    print_usage(std::cout);
    return 0;
  }

  if (args.front() == "--version") {
    std::cout << grok_mcp::core::kServerName << ' ' << grok_mcp::core::kServerVersion << '\n';
    return 0;
  }

  std::cerr << "unrecognized argument: " << args.front() << '\n';
  print_usage(std::cerr);
  return 2;
}
