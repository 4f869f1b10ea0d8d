#include "core/log.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include "core/timestamp.hpp"

namespace grok_mcp::core {

const char* log_level_name(const LogLevel level) noexcept {
  switch (level) {
    case LogLevel::debug:
      return "DEBUG";
    case LogLevel::info:
      return "INFO";
    case LogLevel::warning:
      return "WARNING";
    case LogLevel::error:
      return "ERROR";
  }
  return "INFO";
}

LogLevel parse_log_level(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lower),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") {
    return LogLevel::debug;
  }
  if (lower == "info") {
    return LogLevel::info;
  }
  if (lower == "warning" || lower == "warn") {
    return LogLevel::warning;
  }
  if (lower == "error") {
    return LogLevel::error;
  }
  throw std::runtime_error("log level must be one of debug, info, warning, error");
}

Logger::Logger(std::ostream& sink, const LogLevel min_level) : sink_(sink), min_level_(min_level) {}

void Logger::log(const LogLevel level, const std::string_view message) const {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }

  std::ostringstream line;
  line << format_log_timestamp(unix_timestamp_now_ms()) << " - " << log_level_name(level) << " - " << message
       << '\n';
  sink_ << line.str();
  sink_.flush();
}

}  // namespace grok_mcp::core
