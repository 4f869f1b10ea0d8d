#include "mcp/validation.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace grok_mcp::mcp {

namespace {

bool is_space(const unsigned char c) { return std::isspace(c) != 0; }

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return is_space(c); });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return is_space(c); }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

std::size_t utf8_length(const std::string_view text) noexcept {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](unsigned char c) { return (c & 0xC0U) != 0x80U; }));
}

std::string utf8_prefix(const std::string& text, const std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0U) != 0x80U) {
      if (chars == max_chars) {
        return text.substr(0, i);
      }
      ++chars;
    }
  }
  return text;
}

std::string truncate_input(const std::string& text, const std::size_t max_length, const std::string_view field,
                           const core::Logger* log) {
  const std::size_t length = utf8_length(text);
  if (length <= max_length) {
    return text;
  }

  if (log != nullptr) {
    std::ostringstream message;
    message << field << " truncated from " << length << " to " << max_length << " characters";
    log->warning(message.str());
  }
  return utf8_prefix(text, max_length);
}

std::string sanitize_focus(const std::string& focus, const std::size_t max_length) {
  std::string capped = utf8_prefix(focus, max_length);
  std::replace(capped.begin(), capped.end(), '\n', ' ');
  std::replace(capped.begin(), capped.end(), '\r', ' ');
  capped = trim(capped);
  return capped.empty() ? std::string(kDefaultFocus) : capped;
}

bool is_blank(const std::string_view text) noexcept {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return is_space(c); });
}

Outcome<std::string> string_argument(const nlohmann::json& arguments, const std::string& field,
                                     const std::string& fallback) {
  if (!arguments.is_object()) {
    return fallback;
  }

  const auto it = arguments.find(field);
  if (it == arguments.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    return ToolError{ToolErrorCode::invalid_argument, field + " must be a string"};
  }
  return it->get<std::string>();
}

Outcome<std::string> required_text(const nlohmann::json& arguments, const std::string& field,
                                   const std::size_t max_length, const core::Logger* log) {
  auto value = string_argument(arguments, field);
  if (std::holds_alternative<ToolError>(value)) {
    return value;
  }

  std::string text = truncate_input(std::get<std::string>(value), max_length, field, log);
  if (is_blank(text)) {
    return ToolError{ToolErrorCode::empty_input, field + " cannot be empty"};
  }
  return text;
}

}  // namespace grok_mcp::mcp
