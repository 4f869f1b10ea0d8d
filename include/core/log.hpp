#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

namespace grok_mcp::core {

enum class LogLevel { debug, info, warning, error };

const char* log_level_name(LogLevel level) noexcept;
LogLevel parse_log_level(const std::string& value);

class Logger {
 public:
  explicit Logger(std::ostream& sink, LogLevel min_level = LogLevel::info);

  void log(LogLevel level, std::string_view message) const;
  void debug(std::string_view message) const { log(LogLevel::debug, message); }
  void info(std::string_view message) const { log(LogLevel::info, message); }
  void warning(std::string_view message) const { log(LogLevel::warning, message); }
  void error(std::string_view message) const { log(LogLevel::error, message); }

  [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

 private:
  std::ostream& sink_;
  LogLevel min_level_;
};

}  // namespace grok_mcp::core
