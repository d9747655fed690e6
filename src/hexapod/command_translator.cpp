#include "hexapod/command_translator.hpp"

#include <array>
#include <cmath>

namespace hexapod {

namespace {

using Handler = Translation (*)(const Calibration&, const Command&);

Translation timed(core::PacketFields f, double seconds) {
  f.duration = CommandTranslator::seconds_to_cycles(seconds);
  return Translation{core::Packet::build(f), seconds};
}

Translation move_forward(const Calibration& cal, const Command& cmd) {
  return timed({.power = 100}, cmd.number() * cal.speed_factor_s_per_m);
}

Translation move_back(const Calibration& cal, const Command& cmd) {
  return timed({.power = 100, .angle = 180}, cmd.number() * cal.speed_factor_s_per_m);
}

Translation turn_left(const Calibration& cal, const Command& cmd) {
  return timed({.rotation = -100}, cal.rotation_period_s * cmd.number() / 360.0);
}

Translation turn_right(const Calibration& cal, const Command& cmd) {
  return timed({.rotation = 100}, cal.rotation_period_s * cmd.number() / 360.0);
}

Translation tilt_forward(const Calibration&, const Command& cmd) {
  return timed({.static_tilt = 1, .acc_x = -30}, cmd.number());
}

Translation tilt_back(const Calibration&, const Command& cmd) {
  return timed({.static_tilt = 1, .acc_x = 30}, cmd.number());
}

Translation tilt_left(const Calibration&, const Command& cmd) {
  return timed({.static_tilt = 1, .acc_y = -30}, cmd.number());
}

Translation tilt_right(const Calibration&, const Command& cmd) {
  return timed({.static_tilt = 1, .acc_y = 30}, cmd.number());
}

Translation rest(const Calibration&, const Command& cmd) {
  const double s = cmd.number();
  if (s > 0) return timed({}, s);
  return Translation{core::Packet::neutral(), 0.0};
}

Translation custom(const Calibration&, const Command& cmd) {
  const core::Packet pkt = cmd.packet();
  return Translation{pkt, pkt.duration() > 0 ? pkt.duration_s() : 0.0};
}

// Indexed by CommandKind.
constexpr std::array<Handler, kCommandKindCount> kHandlers{
  move_forward,
  move_back,
  turn_left,
  turn_right,
  tilt_forward,
  tilt_back,
  tilt_left,
  tilt_right,
  rest,
  custom,
};

static_assert(static_cast<uint8_t>(CommandKind::CUSTOM) + 1 == kCommandKindCount,
              "handler table must cover every command kind");

} // namespace

uint32_t CommandTranslator::seconds_to_cycles(double seconds) noexcept {
  const double cycles = seconds * core::kCyclesPerSecond;
  if (!std::isfinite(cycles) || std::fabs(cycles) >= 9.0e18) return 0;
  const auto c = static_cast<int64_t>(cycles);
  if (c >= 0) return static_cast<uint32_t>(c);
  // Negative spans keep the robot's byte split: high = c / 256 and low = c mod 256,
  // both truncated toward zero and taken as bytes.
  const auto hi = static_cast<uint32_t>(c / 256) & 0xFF;
  const auto lo = static_cast<uint32_t>(c) & 0xFF;
  return (hi << 8) | lo;
}

Translation CommandTranslator::translate(const Command& cmd) const {
  const auto idx = static_cast<uint8_t>(cmd.kind);
  if (idx >= kHandlers.size()) return Translation{};
  return kHandlers[idx](cal_, cmd);
}

} // namespace hexapod
