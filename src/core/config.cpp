#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace grok_mcp::core {
namespace {

constexpr long kMaxTimeoutSeconds = 3600;

std::string getenv_or(const char* name, const std::string& fallback) {
  if (const auto* value = std::getenv(name); value != nullptr) {
    return std::string(value);
  }
  return fallback;
}

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

void apply_env_value(ServerConfig& config, const std::string& key, const std::string& value) {
  if (key == kApiKeyEnv) {
    config.gateway.api_key = trim(value);
    return;
  }

  if (key == "XAI_API_BASE_URL") {
    std::string url = trim(value);
    while (!url.empty() && url.back() == '/') {
      url.pop_back();
    }
    if (url.empty()) {
      throw std::runtime_error("XAI_API_BASE_URL must not be empty");
    }
    config.gateway.base_url = url;
    return;
  }

  if (key == "GROK_MCP_TIMEOUT_SECONDS") {
    long seconds = 0;
    try {
      std::size_t consumed = 0;
      seconds = std::stol(value, &consumed);
      if (consumed != value.size()) {
        throw std::invalid_argument(value);
      }
    } catch (const std::logic_error&) {
      throw std::runtime_error("GROK_MCP_TIMEOUT_SECONDS must be an integer");
    }
    if (seconds <= 0) {
      throw std::runtime_error("GROK_MCP_TIMEOUT_SECONDS must be greater than 0");
    }
    if (seconds > kMaxTimeoutSeconds) {
      throw std::runtime_error("GROK_MCP_TIMEOUT_SECONDS must be less than or equal to 3600");
    }
    config.gateway.timeout = std::chrono::seconds(seconds);
    return;
  }

  if (key == "GROK_MCP_LOG_LEVEL") {
    config.log_level = parse_log_level(trim(value));
  }
}

}  // namespace

const std::vector<ModelInfo>& available_models() {
  static const std::vector<ModelInfo> models{
      {"grok-4", "Flagship model (256K context)"},
      {"grok-4-1-fast-reasoning", "Fast reasoning model (2M context) - Default"},
      {"grok-4-fast", "Fast with reasoning (2M context)"},
      {"grok-3", "Previous flagship (128K context)"},
      {"grok-3-mini", "Lighter/cheaper option (128K context)"},
      {"grok-2", "Grok 2 (128K context)"},
      {"grok-2-vision", "Vision capable (32K context)"},
  };
  return models;
}

bool is_known_model(const std::string_view id) {
  const auto& models = available_models();
  return std::any_of(models.begin(), models.end(), [id](const ModelInfo& model) { return model.id == id; });
}

std::filesystem::path default_config_path() {
  const std::string home = getenv_or("HOME", "");
  std::filesystem::path base(home);
  if (home.empty()) {
    std::error_code ec;
    base = std::filesystem::current_path(ec);
    if (ec) {
      base = ".";
    }
  }
  return base / ".claude-mcp-servers" / "grok" / "config.json";
}

nlohmann::json load_config_file(const std::filesystem::path& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return nlohmann::json::object();
  }

  auto parsed = nlohmann::json::parse(input, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return nlohmann::json::object();
  }
  return parsed;
}

void save_config_file(const std::filesystem::path& path, const nlohmann::json& config) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("unable to create config directory " + path.parent_path().string() + ": " +
                               ec.message());
    }
  }

  std::ofstream output(path, std::ios::trunc);
  if (!output.is_open()) {
    throw std::runtime_error("unable to open config file for writing: " + path.string());
  }

  output << config.dump(2) << '\n';
  output.flush();
  if (!output) {
    throw std::runtime_error("failed writing config file: " + path.string());
  }
}

std::string resolve_model(const nlohmann::json& config) {
  if (config.is_object()) {
    const auto model_it = config.find("model");
    if (model_it != config.end() && model_it->is_string() && !model_it->get_ref<const std::string&>().empty()) {
      return model_it->get<std::string>();
    }
  }
  return kDefaultModel;
}

ServerConfig load_server_config(const std::filesystem::path& path) {
  ServerConfig config{};
  config.model = resolve_model(load_config_file(path));

  for (const char* key : {kApiKeyEnv, "XAI_API_BASE_URL", "GROK_MCP_TIMEOUT_SECONDS", "GROK_MCP_LOG_LEVEL"}) {
    if (const auto* value = std::getenv(key); value != nullptr) {
      apply_env_value(config, key, value);
    }
  }

  return config;
}

}  // namespace grok_mcp::core
