#include "core/packet.hpp"
#include "connection/wire_codec.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <sstream>

namespace core {

namespace {

int16_t clamp16(int16_t v, int16_t lo, int16_t hi) noexcept {
  return std::clamp(v, lo, hi);
}

int16_t flag(int16_t v) noexcept {
  return v != 0 ? 1 : 0;
}

} // namespace

Packet Packet::build(const PacketFields& f) {
  Packet p;
  p.power_       = f.power;
  p.angle_       = f.angle;
  p.rotation_    = f.rotation;
  p.static_tilt_ = f.static_tilt;
  p.moving_tilt_ = f.moving_tilt;
  p.on_off_      = f.on_off;
  p.acc_x_       = f.acc_x;
  p.acc_y_       = f.acc_y;
  p.duration_    = f.duration;

  if (f.aux) {
    if (f.aux->size() == kAuxSize) {
      std::copy(f.aux->begin(), f.aux->end(), p.aux_.begin());
    } else {
      logger::warn() << "[PKT] aux array must hold exactly " << kAuxSize
                     << " bytes (got " << f.aux->size() << "); using defaults";
      p.aux_ = kDefaultAux;
    }
  }
  return p;
}

Packet Packet::build_strict(const PacketFields& f) {
  Packet p = build(f);
  p.power_       = clamp16(p.power_, 0, 100);
  p.angle_       = clamp16(p.angle_, -180, 180);
  p.rotation_    = clamp16(p.rotation_, -100, 100);
  p.static_tilt_ = flag(p.static_tilt_);
  p.moving_tilt_ = flag(p.moving_tilt_);
  p.on_off_      = flag(p.on_off_);
  p.acc_x_       = clamp16(p.acc_x_, -40, 40);
  p.acc_y_       = clamp16(p.acc_y_, -40, 40);
  p.aux_[0]      = std::min<uint8_t>(p.aux_[0], 100);
  p.aux_[1]      = std::min<uint8_t>(p.aux_[1], 100);
  p.duration_    = std::min<uint32_t>(p.duration_, 0xFFFF);

  if (p.static_tilt_ && p.moving_tilt_) {
    logger::warn() << "[PKT] static_tilt and moving_tilt are exclusive; clearing moving_tilt";
    p.moving_tilt_ = 0;
  }
  return p;
}

PacketFields Packet::fields() const {
  PacketFields f;
  f.power       = power_;
  f.angle       = angle_;
  f.rotation    = rotation_;
  f.static_tilt = static_tilt_;
  f.moving_tilt = moving_tilt_;
  f.on_off      = on_off_;
  f.acc_x       = acc_x_;
  f.acc_y       = acc_y_;
  f.aux         = std::vector<uint8_t>(aux_.begin(), aux_.end());
  f.duration    = duration_;
  return f;
}

PacketBytes Packet::serialize() const noexcept {
  PacketBytes out{};
  (void)connection::wire::encode_packet(out, *this);
  return out;
}

std::string to_string(const Packet& pkt) {
  std::ostringstream oss;
  oss << "{power:" << pkt.power()
      << ", angle:" << pkt.angle()
      << ", rotation:" << pkt.rotation()
      << ", static_tilt:" << pkt.static_tilt()
      << ", moving_tilt:" << pkt.moving_tilt()
      << ", on_off:" << pkt.on_off()
      << ", acc_x:" << pkt.acc_x()
      << ", acc_y:" << pkt.acc_y()
      << ", aux:[";
  for (size_t i = 0; i < kAuxSize; ++i) {
    if (i) oss << ",";
    oss << static_cast<unsigned>(pkt.aux()[i]);
  }
  oss << "], duration:" << pkt.duration() << "}";
  return oss.str();
}

} // namespace core
