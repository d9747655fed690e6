#pragma once
#include "core/packet.hpp"

#include <cstdint>
#include <span>

namespace connection::wire {

/**
 * @brief Wire format of the robot control packet.
 *
 * Layout (22 bytes, multi-byte fields BIG-ENDIAN):
 *   0..2   'P','K','T' magic
 *   3      power
 *   4      angle / 2 (signed; one byte cannot hold [-180..180], robot doubles it)
 *   5      rotation (signed)
 *   6      static_tilt
 *   7      moving_tilt
 *   8      on_off
 *   9      acc_x (signed)
 *   10     acc_y (signed)
 *   11..19 aux[0..8]
 *   20..21 duration (u16)
 *
 * Values are written as raw bytes: anything out of range wraps modulo 256.
 */

inline constexpr uint8_t kMagic[3] = {'P', 'K', 'T'};
inline constexpr size_t  kMagicSize = sizeof(kMagic);

inline constexpr size_t kOffPower      = 3;
inline constexpr size_t kOffAngle      = 4;
inline constexpr size_t kOffRotation   = 5;
inline constexpr size_t kOffStaticTilt = 6;
inline constexpr size_t kOffMovingTilt = 7;
inline constexpr size_t kOffOnOff      = 8;
inline constexpr size_t kOffAccX       = 9;
inline constexpr size_t kOffAccY       = 10;
inline constexpr size_t kOffAux        = 11;
inline constexpr size_t kOffDuration   = 20;

static_assert(kOffAux + core::kAuxSize == kOffDuration, "aux must end where duration starts");
static_assert(kOffDuration + 2 == core::kPacketSize, "packet must be 22 bytes");

// ---- Endian helpers ----
inline void write_u16_be(uint8_t* out, uint16_t v) noexcept {
  out[0] = static_cast<uint8_t>((v >> 8) & 0xFF);
  out[1] = static_cast<uint8_t>(v & 0xFF);
}

inline uint16_t read_u16_be(const uint8_t* in) noexcept {
  return static_cast<uint16_t>((static_cast<uint16_t>(in[0]) << 8) |
                               static_cast<uint16_t>(in[1]));
}

inline uint8_t to_byte(int v) noexcept {
  return static_cast<uint8_t>(v & 0xFF);
}

inline int16_t from_signed_byte(uint8_t b) noexcept {
  return static_cast<int16_t>(static_cast<int8_t>(b));
}

[[nodiscard]] inline bool has_magic(std::span<const uint8_t> in) noexcept {
  return in.size() >= kMagicSize &&
         in[0] == kMagic[0] && in[1] == kMagic[1] && in[2] == kMagic[2];
}

// ---- Codec (return false if span has wrong size / bad magic) ----
bool encode_packet(std::span<uint8_t> out, const core::Packet& pkt) noexcept;

/// Symmetric decoder. angle comes back doubled, so odd angles lose their low bit.
bool decode_packet(std::span<const uint8_t> in, core::Packet& out);

} // namespace connection::wire
