#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "core/log.hpp"

namespace grok_mcp::mcp {

enum class ToolErrorCode { empty_input, invalid_argument, unknown_tool };

struct ToolError {
  ToolErrorCode code;
  std::string message;
};

template <typename T>
using Outcome = std::variant<T, ToolError>;

inline constexpr const char* kDefaultFocus = "general";

// Lengths below count UTF-8 code points; cuts never split a multi-byte sequence.
std::size_t utf8_length(std::string_view text) noexcept;
std::string utf8_prefix(const std::string& text, std::size_t max_chars);

std::string truncate_input(const std::string& text, std::size_t max_length, std::string_view field,
                           const core::Logger* log = nullptr);

std::string sanitize_focus(const std::string& focus, std::size_t max_length = 50);

bool is_blank(std::string_view text) noexcept;

// Missing fields resolve to fallback; present non-string fields are rejected.
Outcome<std::string> string_argument(const nlohmann::json& arguments, const std::string& field,
                                     const std::string& fallback = {});

// string_argument + truncate_input + rejection of whitespace-only values.
Outcome<std::string> required_text(const nlohmann::json& arguments, const std::string& field, std::size_t max_length,
                                   const core::Logger* log = nullptr);

}  // namespace grok_mcp::mcp
