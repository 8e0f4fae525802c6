#pragma once
#include <atomic>

// Engine-level lines ([ENGINE] ...) can be silenced with --quiet; RPC lines stay.
inline std::atomic<bool>& engine_log_enabled() {
  static std::atomic<bool> on{true};
  return on;
}
