#pragma once

#include <cstdint>

namespace eventship::model {

/*
  Tailing engine states.

    Idle -> Opening -> Reading -> (Reading | Waiting) -> Closing -> Idle

  Recovering is entered from Reading or Waiting when the log was
  invalidated, and from Opening when the checkpoint belongs to an earlier
  lifetime of the log.
*/
enum class EngineState : std::uint8_t {
  kIdle       = 0,
  kOpening    = 1,
  kReading    = 2,
  kWaiting    = 3,
  kRecovering = 4,
  kClosing    = 5,
};

constexpr const char* EngineStateName(EngineState state) {
  switch (state) {
    case EngineState::kIdle:
      return "idle";
    case EngineState::kOpening:
      return "opening";
    case EngineState::kReading:
      return "reading";
    case EngineState::kWaiting:
      return "waiting";
    case EngineState::kRecovering:
      return "recovering";
    case EngineState::kClosing:
      return "closing";
  }
  return "unknown";
}

// Closing is reachable from every active state; shutdown and fatal errors
// both leave through it.
constexpr bool CanTransition(EngineState from, EngineState to) {
  if (to == EngineState::kClosing) {
    return from != EngineState::kIdle && from != EngineState::kClosing;
  }

  switch (from) {
    case EngineState::kIdle:
      return to == EngineState::kOpening;
    case EngineState::kOpening:
      return to == EngineState::kOpening || to == EngineState::kReading || to == EngineState::kRecovering;
    case EngineState::kReading:
      return to == EngineState::kReading || to == EngineState::kWaiting || to == EngineState::kRecovering ||
             to == EngineState::kOpening;
    case EngineState::kWaiting:
      return to == EngineState::kReading || to == EngineState::kRecovering;
    case EngineState::kRecovering:
      return to == EngineState::kRecovering || to == EngineState::kReading;
    case EngineState::kClosing:
      return to == EngineState::kIdle;
  }
  return false;
}

} // namespace eventship::model
