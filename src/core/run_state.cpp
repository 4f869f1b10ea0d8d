#include "core/run_state.hpp"

namespace grok_mcp::core {

const char* run_phase_name(const RunPhase phase) noexcept {
  switch (phase) {
    case RunPhase::running:
      return "running";
    case RunPhase::stopping:
      return "stopping";
    case RunPhase::stopped:
      return "stopped";
  }
  return "unknown";
}

RunState::RunState(const volatile std::sig_atomic_t* stop_signal) noexcept : stop_signal_(stop_signal) {}

bool RunState::stop_signalled() const noexcept { return stop_signal_ != nullptr && *stop_signal_ != 0; }

bool RunState::should_continue() noexcept {
  if (phase_ == RunPhase::running && stop_signalled()) {
    phase_ = RunPhase::stopping;
  }
  return phase_ == RunPhase::running;
}

void RunState::request_stop() noexcept {
  if (phase_ == RunPhase::running) {
    phase_ = RunPhase::stopping;
  }
}

void RunState::finish() noexcept {
  if (phase_ == RunPhase::running) {
    phase_ = RunPhase::stopping;
  }
  phase_ = RunPhase::stopped;
}

}  // namespace grok_mcp::core
