#pragma once

#include <csignal>
#include <cstddef>

namespace grok_mcp::core {

enum class RunPhase { running, stopping, stopped };

const char* run_phase_name(RunPhase phase) noexcept;

struct RunStats {
  std::size_t lines_read{0};
  std::size_t decode_errors{0};
  std::size_t notifications{0};
  std::size_t requests{0};
  std::size_t responses_written{0};
  std::size_t error_responses{0};
};

class RunState {
 public:
  explicit RunState(const volatile std::sig_atomic_t* stop_signal = nullptr) noexcept;

  // Polled at the top of each loop iteration. Moves running -> stopping once a stop was signalled.
  [[nodiscard]] bool should_continue() noexcept;

  void request_stop() noexcept;
  void finish() noexcept;

  [[nodiscard]] RunPhase phase() const noexcept { return phase_; }
  [[nodiscard]] bool stop_signalled() const noexcept;

  RunStats& stats() noexcept { return stats_; }
  [[nodiscard]] const RunStats& stats() const noexcept { return stats_; }

 private:
  const volatile std::sig_atomic_t* stop_signal_;
  RunPhase phase_{RunPhase::running};
  RunStats stats_{};
};

}  // namespace grok_mcp::core
