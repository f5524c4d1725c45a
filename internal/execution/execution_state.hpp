#pragma once

#include <cstdint>
#include <string_view>

namespace lipsync::execution {

enum class ExecutionState : std::uint8_t {
  kSubmitted    = 0,
  kExecuting    = 1,
  kComplete     = 2,
  kFailed       = 3,
  kDisconnected = 4,
};

// kDisconnected is followed by a reconnect on the same client id.
constexpr bool IsTerminal(ExecutionState state) {
  return state == ExecutionState::kComplete || state == ExecutionState::kFailed;
}

constexpr std::string_view ToString(ExecutionState state) {
  switch (state) {
    case ExecutionState::kSubmitted:
      return "SUBMITTED";
    case ExecutionState::kExecuting:
      return "EXECUTING";
    case ExecutionState::kComplete:
      return "COMPLETE";
    case ExecutionState::kFailed:
      return "FAILED";
    case ExecutionState::kDisconnected:
      return "DISCONNECTED";
  }
  return "UNKNOWN";
}

} // namespace lipsync::execution
