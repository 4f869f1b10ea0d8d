#pragma once

#include <string>

namespace grok_mcp::mcp {

inline constexpr const char* kCodeReviewSystemRole = "You are an expert code reviewer.";
inline constexpr const char* kBrainstormSystemRole = "You are a creative problem solver and brainstorming partner.";

std::string build_code_review_prompt(const std::string& code, const std::string& focus);
std::string build_brainstorm_prompt(const std::string& topic, const std::string& context);

}  // namespace grok_mcp::mcp
