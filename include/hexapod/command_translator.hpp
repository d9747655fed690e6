#pragma once
#include "core/packet.hpp"
#include "hexapod/commands.hpp"

#include <cstdint>

namespace hexapod {

/// Robot calibration. Both constants are measured on the robot at full power.
struct Calibration {
  double speed_factor_s_per_m{13.0}; // seconds to walk one metre
  double rotation_period_s{13.0};    // seconds for a full 360 deg turn
};

/// A translated command: what to stream and for how long (wall clock).
struct Translation {
  core::Packet packet{};
  double duration_s{0.0};
};

/**
 * @brief Pure mapping Command -> (Packet, seconds).
 *
 * The packet's own duration is the same span expressed in 20 ms robot cycles
 * (truncated to a whole cycle), so the robot stops on its own even if the host
 * goes quiet.
 */
class CommandTranslator {
public:
  explicit CommandTranslator(Calibration cal = {}) : cal_(cal) {}

  [[nodiscard]] Translation translate(const Command& cmd) const;

  const Calibration& calibration() const noexcept { return cal_; }

  /// seconds * 50, truncated. Non-finite input maps to 0. A negative span
  /// encodes as bytes (c / 256, c mod 256), so -162 becomes 0x005E.
  [[nodiscard]] static uint32_t seconds_to_cycles(double seconds) noexcept;

private:
  Calibration cal_;
};

} // namespace hexapod
