#pragma once
#include <cstdint>

namespace hexapod {

enum class RobotState : uint8_t {
  IDLE = 0,
  RUNNING = 1,
};

enum class CommandKind : uint8_t {
  MOVE_FORWARD = 0,
  MOVE_BACK = 1,
  TURN_LEFT = 2,
  TURN_RIGHT = 3,
  TILT_FORWARD = 4,
  TILT_BACK = 5,
  TILT_LEFT = 6,
  TILT_RIGHT = 7,
  REST = 8,
  CUSTOM = 9,
};

inline constexpr uint8_t kCommandKindCount = 10;

inline const char* to_string(RobotState s) noexcept {
  switch (s) {
    case RobotState::IDLE:    return "idle";
    case RobotState::RUNNING: return "running";
  }
  return "unknown";
}

} // namespace hexapod
