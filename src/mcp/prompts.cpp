#include "mcp/prompts.hpp"

namespace grok_mcp::mcp {

std::string build_code_review_prompt(const std::string& code, const std::string& focus) {
  std::string prompt = "Please review this code with a focus on " + focus + ":\n\n```\n";
  prompt += code;
  prompt +=
      "\n```\n\n"
      "Provide specific, actionable feedback on:\n"
      "1. Potential issues or bugs\n"
      "2. Security concerns\n"
      "3. Performance optimizations\n"
      "4. Best practices\n"
      "5. Code clarity and maintainability";
  return prompt;
}

std::string build_brainstorm_prompt(const std::string& topic, const std::string& context) {
  std::string prompt = "Let's brainstorm about: " + topic;
  if (!context.empty()) {
    prompt += "\n\nContext: " + context;
  }
  prompt += "\n\nProvide creative ideas, alternatives, and considerations.";
  return prompt;
}

}  // namespace grok_mcp::mcp
