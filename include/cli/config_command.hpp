#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace grok_mcp::cli {

struct ConfigOptions {
  std::optional<std::string> model{};
  bool show{false};
  bool list_models{false};
};

// Throws std::invalid_argument for unrecognized options or a missing --model value.
ConfigOptions parse_config_options(const std::vector<std::string>& args);

void print_config_usage(std::ostream& out);

// Exit status: 0 on success, 1 on an unknown model or a failed save, 2 on bad usage.
int run_config_command(const std::vector<std::string>& args, const std::filesystem::path& config_path,
                       std::ostream& out, std::ostream& err);

}  // namespace grok_mcp::cli
