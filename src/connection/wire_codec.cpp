#include "connection/wire_codec.hpp"

#include <vector>

namespace connection::wire {

bool encode_packet(std::span<uint8_t> out, const core::Packet& pkt) noexcept {
  if (out.size() != core::kPacketSize) return false;

  out[0] = kMagic[0];
  out[1] = kMagic[1];
  out[2] = kMagic[2];

  out[kOffPower]      = to_byte(pkt.power());
  out[kOffAngle]      = to_byte(pkt.angle() / 2); // truncates toward zero
  out[kOffRotation]   = to_byte(pkt.rotation());
  out[kOffStaticTilt] = to_byte(pkt.static_tilt());
  out[kOffMovingTilt] = to_byte(pkt.moving_tilt());
  out[kOffOnOff]      = to_byte(pkt.on_off());
  out[kOffAccX]       = to_byte(pkt.acc_x());
  out[kOffAccY]       = to_byte(pkt.acc_y());

  const auto& aux = pkt.aux();
  for (size_t i = 0; i < core::kAuxSize; ++i) out[kOffAux + i] = aux[i];

  // high byte = duration div 256, low byte = duration mod 256
  write_u16_be(out.data() + kOffDuration, static_cast<uint16_t>(pkt.duration() & 0xFFFF));
  return true;
}

bool decode_packet(std::span<const uint8_t> in, core::Packet& out) {
  if (in.size() != core::kPacketSize) return false;
  if (!has_magic(in)) return false;

  core::PacketFields f;
  f.power       = in[kOffPower];
  f.angle       = static_cast<int16_t>(from_signed_byte(in[kOffAngle]) * 2);
  f.rotation    = from_signed_byte(in[kOffRotation]);
  f.static_tilt = in[kOffStaticTilt];
  f.moving_tilt = in[kOffMovingTilt];
  f.on_off      = in[kOffOnOff];
  f.acc_x       = from_signed_byte(in[kOffAccX]);
  f.acc_y       = from_signed_byte(in[kOffAccY]);
  f.aux         = std::vector<uint8_t>(in.begin() + kOffAux, in.begin() + kOffDuration);
  f.duration    = read_u16_be(in.data() + kOffDuration);

  out = core::Packet::build(f);
  return true;
}

} // namespace connection::wire
