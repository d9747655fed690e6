#pragma once
#include "core/packet.hpp"
#include "hexapod/enums.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hexapod {

/// A numeric argument (metres, degrees or seconds) or a ready-made packet.
using CommandArg = std::variant<double, core::Packet>;

/**
 * @brief A queued motion intent. Consumed exactly once by the Sequencer.
 */
struct Command {
  CommandKind kind{CommandKind::REST};
  CommandArg arg{0.0};

  static Command make(CommandKind kind, double value) { return Command{kind, value}; }
  static Command custom(const core::Packet& pkt) { return Command{CommandKind::CUSTOM, pkt}; }

  /// Numeric argument, or 0 when the argument is a packet.
  double number() const noexcept {
    const double* v = std::get_if<double>(&arg);
    return v ? *v : 0.0;
  }

  /// Packet argument, or the neutral packet when the argument is numeric.
  core::Packet packet() const {
    const core::Packet* p = std::get_if<core::Packet>(&arg);
    return p ? *p : core::Packet{};
  }
};

const char* to_string(CommandKind kind) noexcept;

/// Inverse of to_string(CommandKind); also accepts short CLI aliases
/// ("forward", "back", "left", "right").
std::optional<CommandKind> parse_command_kind(std::string_view name) noexcept;

std::string describe(const Command& cmd);

} // namespace hexapod
