#include "hexapod/commands.hpp"

#include <sstream>

namespace hexapod {

const char* to_string(CommandKind kind) noexcept {
  switch (kind) {
    case CommandKind::MOVE_FORWARD: return "move_forward";
    case CommandKind::MOVE_BACK:    return "move_back";
    case CommandKind::TURN_LEFT:    return "turn_left";
    case CommandKind::TURN_RIGHT:   return "turn_right";
    case CommandKind::TILT_FORWARD: return "tilt_forward";
    case CommandKind::TILT_BACK:    return "tilt_back";
    case CommandKind::TILT_LEFT:    return "tilt_left";
    case CommandKind::TILT_RIGHT:   return "tilt_right";
    case CommandKind::REST:         return "rest";
    case CommandKind::CUSTOM:       return "custom";
  }
  return "unknown";
}

std::optional<CommandKind> parse_command_kind(std::string_view name) noexcept {
  for (uint8_t i = 0; i < kCommandKindCount; ++i) {
    const auto kind = static_cast<CommandKind>(i);
    if (name == to_string(kind)) return kind;
  }
  if (name == "forward") return CommandKind::MOVE_FORWARD;
  if (name == "back")    return CommandKind::MOVE_BACK;
  if (name == "left")    return CommandKind::TURN_LEFT;
  if (name == "right")   return CommandKind::TURN_RIGHT;
  return std::nullopt;
}

std::string describe(const Command& cmd) {
  std::ostringstream oss;
  oss << "{name:" << to_string(cmd.kind) << ", args:[";
  if (const auto* pkt = std::get_if<core::Packet>(&cmd.arg)) {
    oss << core::to_string(*pkt);
  } else {
    oss << cmd.number();
  }
  oss << "]}";
  return oss.str();
}

} // namespace hexapod
