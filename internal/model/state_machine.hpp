#pragma once

#include <cstdint>
#include <string_view>

namespace pagewise::model {

// kUnstarted is never stored; it describes the absence of a progress record.
enum class ProgressState : std::uint8_t {
  kUnstarted  = 0,
  kInProgress = 1,
  kComplete   = 2,
};

constexpr bool IsTerminal(ProgressState state) {
  return state == ProgressState::kComplete;
}

constexpr bool CanTransition(ProgressState from, ProgressState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == ProgressState::kUnstarted) {
    return false;
  }

  return static_cast<std::uint8_t>(to) >= static_cast<std::uint8_t>(from);
}

constexpr std::string_view ToString(ProgressState state) {
  switch (state) {
    case ProgressState::kInProgress:
      return "in_progress";
    case ProgressState::kComplete:
      return "complete";
    case ProgressState::kUnstarted:
    default:
      return "unstarted";
  }
}

} // namespace pagewise::model
