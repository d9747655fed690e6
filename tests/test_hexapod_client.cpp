#include "hexapod/hexapod_client.hpp"
#include "utils/timer_service.hpp"
#include "fake_timer_service.hpp"
#include "fake_transport.hpp"

#include <cassert>
#include <chrono>
#include <memory>
#include <thread>

using namespace std::chrono_literals;

using hexapod::RobotState;

namespace {

std::shared_ptr<hexapod::RuntimeConfig> test_config() {
  auto cfg = std::make_shared<hexapod::RuntimeConfig>();
  cfg->robot_ip = "127.0.0.1";
  cfg->robot_port = 8080;
  return cfg;
}

struct Rig {
  explicit Rig(std::shared_ptr<hexapod::RuntimeConfig> cfg = test_config())
    : client(std::move(cfg), stream, &echo, timers, timers) {}

  tests::FakeStreamTransport stream;
  tests::FakeOneShotTransport echo;
  tests::FakeTimerService timers;
  hexapod::HexapodClient client;
};

const auto kForward = core::Packet::build({.power = 100, .duration = 650});
const auto kTurnLeft = core::Packet::build({.rotation = -100, .duration = 162});

} // namespace

static void test_rejects_non_positive_distance() {
  Rig r;
  assert(!r.client.move_forward(0.0));
  assert(!r.client.move_forward(-1.0));
  assert(!r.client.move_back(0.0));
  assert(r.client.state() == RobotState::IDLE);
  assert(r.client.pending() == 0);
  assert(r.echo.echoed().empty());
  assert(r.timers.scheduled() == 0);
}

static void test_full_sequence() {
  Rig r;
  assert(r.client.move_forward(1.0));
  r.client.turn_left(90.0);

  assert(r.client.state() == RobotState::RUNNING);
  assert(r.client.streaming());
  assert(r.client.current_packet() == kForward);

  r.timers.advance_ms(1000);
  assert(r.stream.open_calls() == 1);
  assert(r.stream.sent().size() == 10);
  assert(r.stream.sent().back() == kForward);

  r.timers.advance_ms(20000);
  assert(r.client.state() == RobotState::IDLE);
  assert(!r.client.streaming());
  assert(!r.stream.is_open());
  assert(r.stream.close_calls() == 1);

  const auto sent = r.stream.sent();
  assert(sent.back() == core::Packet::neutral());
  bool saw_turn = false;
  for (const auto& p : sent) saw_turn = saw_turn || p == kTurnLeft;
  assert(saw_turn);

  const auto echoed = r.echo.echoed();
  assert(echoed.size() == 3);
  assert(echoed[0] == kForward);
  assert(echoed[1] == kTurnLeft);
  assert(echoed[2] == core::Packet::neutral());

  // nothing more once the sequence is over
  const size_t count = sent.size();
  r.timers.advance_ms(5000);
  assert(r.stream.sent().size() == count);
}

static void test_disconnect_mid_sequence() {
  Rig r;
  assert(r.client.move_forward(2.0));
  r.client.tilt_left(3.0);
  r.timers.advance_ms(500);
  assert(r.stream.is_open());

  r.client.disconnect();
  assert(r.client.state() == RobotState::IDLE);
  assert(r.client.pending() == 0);
  assert(r.client.current_packet() == core::Packet::neutral());
  assert(!r.stream.is_open());
  assert(r.stream.sent().back() == core::Packet::neutral());
  assert(r.timers.active() == 0);

  r.timers.advance_ms(60000);
  assert(r.echo.echoed().size() == 1);
}

static void test_rest_now_echoes_twice_without_streaming() {
  Rig r;
  r.client.rest();
  assert(r.client.state() == RobotState::IDLE);
  assert(!r.client.streaming());

  const auto echoed = r.echo.echoed();
  assert(echoed.size() == 2);
  assert(echoed[0] == core::Packet::neutral() && echoed[1] == core::Packet::neutral());
  assert(r.stream.open_calls() == 0);
  assert(r.stream.sent().empty());
}

static void test_echo_disabled() {
  auto cfg = test_config();
  cfg->http_echo = false;
  Rig r(cfg);

  r.client.tilt_forward(1.0);
  r.client.send_packet_http(kForward);
  r.timers.advance_ms(2000);
  assert(r.echo.echoed().empty());
  assert(r.client.state() == RobotState::IDLE);
  assert(!r.stream.sent().empty());
}

static void test_send_packet_http_outside_sequence() {
  Rig r;
  r.client.send_packet_http(kTurnLeft);
  assert(r.echo.echoed().size() == 1);
  assert(r.echo.echoed()[0] == kTurnLeft);
  assert(r.client.state() == RobotState::IDLE);
}

static void test_custom_packet() {
  Rig r;
  const auto pkt = core::Packet::build({.power = 50, .angle = -90, .duration = 50});
  r.client.send_custom(pkt);
  assert(r.client.current_packet() == pkt);
  r.timers.advance_ms(1200);
  assert(r.client.state() == RobotState::IDLE);
  assert(r.echo.echoed().front() == pkt);
}

static void test_connect_failure_does_not_stall_sequence() {
  Rig r;
  r.stream.set_fail_open(true);
  assert(!r.client.connect());

  assert(r.client.move_back(0.1));
  r.timers.advance_ms(5000);
  assert(r.client.state() == RobotState::IDLE);
  assert(r.stream.open_calls() == 2);
  assert(r.stream.sent().empty());
}

static void test_connect_then_disconnect_without_commands() {
  Rig r;
  assert(r.client.connect());
  assert(r.stream.is_open());
  r.client.disconnect();
  assert(!r.stream.is_open());
  assert(r.stream.sent().size() == 1);
  assert(r.stream.sent()[0] == core::Packet::neutral());
}

static void test_target_and_rate_from_config() {
  auto cfg = test_config();
  cfg->robot_ip = "192.168.4.1";
  cfg->robot_port = 80;
  cfg->stream_hz = 20.0;
  Rig r(cfg);

  assert(r.client.stream().period() == std::chrono::milliseconds(50));
  assert(r.client.move_forward(1.0));
  r.timers.advance_ms(50);
  assert(r.stream.last_target() == "192.168.4.1:80");
  assert(r.stream.sent().size() == 1);
}

static void test_slow_connect_does_not_block_commands() {
  tests::FakeStreamTransport stream;
  stream.set_open_delay(1500ms);
  utils::TimerService sequence_timers("sequence");
  utils::TimerService stream_timers("stream");
  {
    hexapod::HexapodClient client(test_config(), stream, nullptr, sequence_timers, stream_timers);

    // the first tick starts a connect that hangs; the short sequence finishes meanwhile
    assert(client.move_forward(0.001));
    std::this_thread::sleep_for(300ms);
    assert(stream.open_calls() == 1);
    assert(client.state() == RobotState::IDLE);

    const auto t0 = std::chrono::steady_clock::now();
    client.turn_left(90.0);
    const auto took = std::chrono::steady_clock::now() - t0;
    assert(took < 200ms);
    assert(client.state() == RobotState::RUNNING);
    assert(client.streaming());

    const auto t1 = std::chrono::steady_clock::now();
    client.disconnect();
    assert(std::chrono::steady_clock::now() - t1 < 200ms);
    assert(client.state() == RobotState::IDLE);

    // joins the stream worker once the hung connect returns
    stream_timers.shutdown();
    sequence_timers.shutdown();
  }
  // the channel that opened after the stop was closed again
  assert(!stream.is_open());
  assert(stream.sent().empty());
}

static void test_disconnect_races_with_commands() {
  tests::FakeStreamTransport stream;
  utils::TimerService sequence_timers("sequence");
  utils::TimerService stream_timers("stream");
  {
    hexapod::HexapodClient client(test_config(), stream, nullptr, sequence_timers, stream_timers);

    std::thread commander([&] {
      for (int i = 0; i < 200; ++i) client.tilt_left(10.0);
    });
    for (int i = 0; i < 200; ++i) client.disconnect();
    commander.join();

    std::this_thread::sleep_for(50ms);
    // a running sequence always has a live stream, an idle one never does
    assert((client.state() == RobotState::RUNNING) == client.streaming());

    client.disconnect();
    assert(client.state() == RobotState::IDLE);
    assert(!client.streaming());

    stream_timers.shutdown();
    sequence_timers.shutdown();
  }
  assert(!stream.is_open());
}

int main() {
  test_rejects_non_positive_distance();
  test_full_sequence();
  test_disconnect_mid_sequence();
  test_rest_now_echoes_twice_without_streaming();
  test_echo_disabled();
  test_send_packet_http_outside_sequence();
  test_custom_packet();
  test_connect_failure_does_not_stall_sequence();
  test_connect_then_disconnect_without_commands();
  test_target_and_rate_from_config();
  test_slow_connect_does_not_block_commands();
  test_disconnect_races_with_commands();
  return 0;
}
