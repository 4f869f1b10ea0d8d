#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace grok_mcp::core {

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

// "YYYY-MM-DD HH:MM:SS,mmm" in UTC.
std::string format_log_timestamp(std::uint64_t unix_ms);

}  // namespace grok_mcp::core
