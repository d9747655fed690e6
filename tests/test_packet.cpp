#include "connection/wire_codec.hpp"
#include "core/packet.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <vector>

static void test_neutral_bytes() {
  const core::PacketBytes expected{80, 75, 84,          // 'P','K','T'
                                   0, 0, 0,             // power, angle/2, rotation
                                   0, 0, 1,             // static, moving, on_off
                                   0, 0,                // acc_x, acc_y
                                   50, 25, 0, 0, 0, 0, 0, 0, 0,
                                   0, 0};               // duration
  assert(core::Packet::neutral().serialize() == expected);
  assert(core::Packet{} == core::Packet::neutral());
}

static void test_field_layout() {
  const auto pkt = core::Packet::build({.power = 100,
                                        .angle = 180,
                                        .rotation = -100,
                                        .static_tilt = 1,
                                        .acc_x = -30,
                                        .acc_y = 30,
                                        .aux = std::vector<uint8_t>{60, 40, 1, 2, 3, 4, 5, 6, 255},
                                        .duration = 650});
  const auto b = pkt.serialize();
  assert(b.size() == 22);
  assert(b[3] == 100);
  assert(b[4] == 90);                  // angle halved
  assert(b[5] == 156);                 // -100 as a two's complement byte
  assert(b[6] == 1 && b[7] == 0 && b[8] == 1);
  assert(b[9] == 226 && b[10] == 30);  // -30, 30
  assert(b[11] == 60 && b[12] == 40 && b[19] == 255);
  assert(b[20] == 2 && b[21] == 138);  // 650 = 2*256 + 138
}

static void test_angle_halving_truncates() {
  assert(core::Packet::build({.angle = 91}).serialize()[4] == 45);
  assert(core::Packet::build({.angle = -91}).serialize()[4] == static_cast<uint8_t>(-45));
  assert(core::Packet::build({.angle = -180}).serialize()[4] == static_cast<uint8_t>(-90));
}

static void test_duration_bytes() {
  const auto b = core::Packet::build({.duration = 65535}).serialize();
  assert(b[20] == 255 && b[21] == 255);

  const auto c = core::Packet::build({.duration = 256}).serialize();
  assert(c[20] == 1 && c[21] == 0);
}

static void test_wrong_length_aux_gets_defaults() {
  const auto short_aux = core::Packet::build({.aux = std::vector<uint8_t>{1, 2, 3}});
  assert(short_aux.aux() == core::kDefaultAux);

  const auto long_aux = core::Packet::build({.aux = std::vector<uint8_t>(10, 7)});
  assert(long_aux.aux() == core::kDefaultAux);

  const auto empty_aux = core::Packet::build({.power = 5, .aux = std::vector<uint8_t>{}});
  assert(empty_aux.aux() == core::kDefaultAux);
  assert(empty_aux.power() == 5); // the rest of the fields survive
}

static void test_build_passes_values_through() {
  const auto p = core::Packet::build({.power = 300, .rotation = -250, .static_tilt = 1, .moving_tilt = 1});
  assert(p.power() == 300);
  assert(p.rotation() == -250);
  assert(p.static_tilt() == 1 && p.moving_tilt() == 1);
  assert(p.serialize()[3] == static_cast<uint8_t>(300 & 0xFF));
}

static void test_build_strict_clamps() {
  const auto p = core::Packet::build_strict({.power = 300,
                                             .angle = -500,
                                             .rotation = 150,
                                             .static_tilt = 1,
                                             .moving_tilt = 1,
                                             .on_off = 7,
                                             .acc_x = -90,
                                             .acc_y = 41,
                                             .aux = std::vector<uint8_t>{200, 101, 9, 9, 9, 9, 9, 9, 9},
                                             .duration = 70000});
  assert(p.power() == 100);
  assert(p.angle() == -180);
  assert(p.rotation() == 100);
  assert(p.static_tilt() == 1 && p.moving_tilt() == 0);
  assert(p.on_off() == 1);
  assert(p.acc_x() == -40 && p.acc_y() == 40);
  assert(p.aux()[0] == 100 && p.aux()[1] == 100 && p.aux()[2] == 9);
  assert(p.duration() == 65535);
}

static void test_decode_reproduces_fields() {
  const auto in = core::Packet::build({.power = 42,
                                       .angle = 91,
                                       .rotation = -7,
                                       .moving_tilt = 1,
                                       .on_off = 0,
                                       .acc_x = -40,
                                       .acc_y = 12,
                                       .aux = std::vector<uint8_t>{10, 20, 30, 40, 50, 60, 70, 80, 90},
                                       .duration = 1234});
  const auto bytes = in.serialize();

  core::Packet out;
  assert(connection::wire::decode_packet(bytes, out));
  assert(out.power() == 42);
  assert(out.angle() == 90);  // nearest even value toward zero
  assert(out.rotation() == -7);
  assert(out.static_tilt() == 0 && out.moving_tilt() == 1 && out.on_off() == 0);
  assert(out.acc_x() == -40 && out.acc_y() == 12);
  assert(out.aux() == in.aux());
  assert(out.duration() == 1234);
}

static void test_fields_rebuild_identical_packet() {
  const auto p = core::Packet::build({.power = 100, .angle = 180, .duration = 650});
  assert(core::Packet::build(p.fields()) == p);
  assert(p.duration_s() == 13.0);
}

int main() {
  test_neutral_bytes();
  test_field_layout();
  test_angle_halving_truncates();
  test_duration_bytes();
  test_wrong_length_aux_gets_defaults();
  test_build_passes_values_through();
  test_build_strict_clamps();
  test_decode_reproduces_fields();
  test_fields_rebuild_identical_packet();
  return 0;
}
