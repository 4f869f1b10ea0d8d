#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/log.hpp"

namespace grok_mcp::core {

inline constexpr const char* kServerName = "grok-mcp";
inline constexpr const char* kServerVersion = "1.2.0";
inline constexpr const char* kDefaultModel = "grok-4-1-fast-reasoning";
inline constexpr const char* kApiKeyEnv = "XAI_API_KEY";

struct ModelInfo {
  std::string_view id;
  std::string_view description;
};

const std::vector<ModelInfo>& available_models();
bool is_known_model(std::string_view id);

struct InputLimits {
  std::size_t max_prompt_length{100000};
  std::size_t max_code_length{500000};
  std::size_t max_focus_length{50};
};

struct GatewayConfig {
  std::string api_key{};
  std::string base_url{"https://api.x.ai/v1"};
  std::chrono::seconds timeout{120};
};

struct ServerConfig {
  std::string model{kDefaultModel};
  GatewayConfig gateway{};
  InputLimits limits{};
  LogLevel log_level{LogLevel::info};
};

// Resolved once at startup and never mutated afterwards.
struct StartupConfig {
  ServerConfig server{};
  bool gateway_available{false};
  std::string gateway_error{};
};

std::filesystem::path default_config_path();

nlohmann::json load_config_file(const std::filesystem::path& path);
void save_config_file(const std::filesystem::path& path, const nlohmann::json& config);

std::string resolve_model(const nlohmann::json& config);

ServerConfig load_server_config(const std::filesystem::path& path);

}  // namespace grok_mcp::core
