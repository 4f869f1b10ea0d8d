#include "core/timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace grok_mcp::core {

std::string format_log_timestamp(const std::uint64_t unix_ms) {
  const auto seconds = static_cast<std::time_t>(unix_ms / 1000U);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream output;
  output << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0')
         << (unix_ms % 1000U);
  return output.str();
}

}  // namespace grok_mcp::core
