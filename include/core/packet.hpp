#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace core {

inline constexpr size_t kPacketSize = 22;   // 'PKT' + 19 payload bytes
inline constexpr size_t kAuxSize    = 9;
inline constexpr int    kCyclesPerSecond = 50; // robot executes a packet in 20 ms cycles

using AuxArray = std::array<uint8_t, kAuxSize>;
using PacketBytes = std::array<uint8_t, kPacketSize>;

// height=50, gait=25, user bytes cleared
inline constexpr AuxArray kDefaultAux{50, 25, 0, 0, 0, 0, 0, 0, 0};

/**
 * @brief Construction input for a Packet.
 *
 * Every field defaults to the neutral "stand still, powered on" value. Ranges
 * documented here are what the robot understands; Packet::build() does not
 * enforce them.
 *
 *  power       [0..100]      translational speed
 *  angle       [-180..180]   walking direction, 0 = forward, 90 = right
 *  rotation    [-100..100]   >0 clockwise, <0 counterclockwise
 *  static_tilt {0,1}         tilt body by acc_x/acc_y while standing
 *  moving_tilt {0,1}         tilt body while walking (exclusive with static_tilt)
 *  on_off      {0,1}         0 puts the robot to sleep
 *  acc_x/acc_y [-40..40]     tenths of m/s^2, used only with a tilt flag
 *  aux         9 bytes       [0]=height, [1]=gait, [2..8] user defined
 *  duration    [0..65535]    20 ms cycles; 0 = rest once the robot-side timeout expires
 */
struct PacketFields {
  int16_t power{0};
  int16_t angle{0};
  int16_t rotation{0};
  int16_t static_tilt{0};
  int16_t moving_tilt{0};
  int16_t on_off{1};
  int16_t acc_x{0};
  int16_t acc_y{0};
  std::optional<std::vector<uint8_t>> aux{};
  uint32_t duration{0};
};

/**
 * @brief One 10 Hz control frame. Immutable once built.
 *
 * A default-constructed Packet is the neutral packet.
 */
class Packet {
public:
  Packet() = default;

  /// Raw pass-through of numeric fields. A wrong-length aux array is replaced
  /// by kDefaultAux and a warning is logged.
  [[nodiscard]] static Packet build(const PacketFields& fields);

  /// Same as build(), then clamps every field to its documented range and
  /// clears moving_tilt when both tilt flags are set.
  [[nodiscard]] static Packet build_strict(const PacketFields& fields);

  [[nodiscard]] static Packet neutral() noexcept { return Packet{}; }

  int16_t power() const noexcept { return power_; }
  int16_t angle() const noexcept { return angle_; }
  int16_t rotation() const noexcept { return rotation_; }
  int16_t static_tilt() const noexcept { return static_tilt_; }
  int16_t moving_tilt() const noexcept { return moving_tilt_; }
  int16_t on_off() const noexcept { return on_off_; }
  int16_t acc_x() const noexcept { return acc_x_; }
  int16_t acc_y() const noexcept { return acc_y_; }
  const AuxArray& aux() const noexcept { return aux_; }
  uint32_t duration() const noexcept { return duration_; }

  /// Duration in seconds as the robot will execute it (0 for the sentinel).
  double duration_s() const noexcept {
    return static_cast<double>(duration_) / kCyclesPerSecond;
  }

  [[nodiscard]] PacketFields fields() const;

  [[nodiscard]] PacketBytes serialize() const noexcept;

  bool operator==(const Packet&) const = default;

private:
  int16_t power_{0};
  int16_t angle_{0};
  int16_t rotation_{0};
  int16_t static_tilt_{0};
  int16_t moving_tilt_{0};
  int16_t on_off_{1};
  int16_t acc_x_{0};
  int16_t acc_y_{0};
  AuxArray aux_{kDefaultAux};
  uint32_t duration_{0};
};

std::string to_string(const Packet& pkt);

} // namespace core
