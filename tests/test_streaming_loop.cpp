#include "hexapod/streaming_loop.hpp"
#include "utils/timer_service.hpp"
#include "fake_timer_service.hpp"
#include "fake_transport.hpp"

#include <cassert>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

namespace {

struct Rig {
  hexapod::LatestValue<core::Packet> cell{core::Packet::neutral()};
  tests::FakeStreamTransport transport;
  tests::FakeTimerService timers;
  hexapod::StreamingLoop loop{cell, transport, timers, hexapod::StreamTarget{"10.0.0.7", 80}};
};

const auto kWalk = core::Packet::build({.power = 100, .duration = 650});

} // namespace

static void test_opens_lazily_on_first_tick() {
  Rig r;
  r.loop.start();
  assert(r.loop.running());
  assert(r.transport.open_calls() == 0);

  r.timers.advance_ms(100);
  assert(r.transport.open_calls() == 1);
  assert(r.transport.last_target() == "10.0.0.7:80");
  assert(r.transport.sent().size() == 1);

  r.timers.advance_ms(1000);
  assert(r.transport.sent().size() == 11);
  assert(r.transport.open_calls() == 1);
  assert(r.loop.packets_sent() == 11);
}

static void test_start_twice_schedules_once() {
  Rig r;
  r.loop.start();
  r.loop.start();
  assert(r.timers.scheduled() == 1);
  assert(r.timers.active() == 1);
}

static void test_ticks_pick_up_cell_updates() {
  Rig r;
  r.loop.start();
  r.timers.advance_ms(250);
  r.cell.store(kWalk);
  r.timers.advance_ms(100);

  const auto sent = r.transport.sent();
  assert(sent.size() == 3);
  assert(sent[0] == core::Packet::neutral());
  assert(sent[1] == core::Packet::neutral());
  assert(sent[2] == kWalk);
}

static void test_stop_sends_final_then_closes() {
  Rig r;
  r.cell.store(kWalk);
  r.loop.start();
  r.timers.advance_ms(300);

  r.loop.stop(core::Packet::neutral());
  assert(!r.loop.running());
  assert(!r.transport.is_open());
  assert(r.transport.close_calls() == 1);
  assert(r.timers.active() == 0);

  r.timers.advance_ms(1000);
  const auto sent = r.transport.sent();
  assert(sent.size() == 4);
  assert(sent[2] == kWalk);
  assert(sent.back() == core::Packet::neutral());
}

static void test_stop_without_channel_sends_nothing() {
  Rig r;
  r.loop.start();
  r.loop.stop(core::Packet::neutral());
  assert(r.transport.sent().empty());
  assert(r.transport.open_calls() == 0);
}

static void test_failed_open_is_not_retried() {
  Rig r;
  r.transport.set_fail_open(true);
  r.loop.start();
  r.timers.advance_ms(1000);
  assert(r.transport.open_calls() == 1);
  assert(r.transport.sent().empty());
  assert(r.loop.running());

  // a new start() is a new attempt
  r.loop.stop(core::Packet::neutral());
  r.transport.set_fail_open(false);
  r.loop.start();
  r.timers.advance_ms(100);
  assert(r.transport.open_calls() == 2);
  assert(r.transport.sent().size() == 1);
}

static void test_open_now_then_stop() {
  Rig r;
  assert(r.loop.open_now());
  assert(r.transport.is_open());
  assert(!r.loop.running());

  r.loop.start();
  r.timers.advance_ms(100);
  assert(r.transport.open_calls() == 1);

  r.loop.stop(core::Packet::neutral());
  assert(r.transport.sent().size() == 2);
  assert(!r.transport.is_open());
}

static void test_open_now_failure() {
  Rig r;
  r.transport.set_fail_open(true);
  assert(!r.loop.open_now());
  r.transport.set_fail_open(false);
  assert(r.loop.open_now());
  assert(r.transport.open_calls() == 2);
  r.loop.stop(core::Packet::neutral());
  assert(r.transport.sent().size() == 1);
}

static void test_send_failure_stops_streaming_until_restart() {
  Rig r;
  r.loop.start();
  r.timers.advance_ms(100);
  assert(r.transport.sent().size() == 1);

  r.transport.set_fail_send(true);
  r.timers.advance_ms(100);
  assert(r.loop.send_errors() == 1);
  assert(!r.transport.is_open());

  r.timers.advance_ms(500);
  assert(r.loop.send_errors() == 1);
  assert(r.transport.open_calls() == 1);
  assert(r.loop.packets_sent() == 1);

  r.transport.set_fail_send(false);
  r.loop.stop(core::Packet::neutral());
  r.loop.start();
  r.timers.advance_ms(100);
  assert(r.transport.open_calls() == 2);
  assert(r.loop.packets_sent() == 2);
}

static void test_stop_during_slow_connect() {
  hexapod::LatestValue<core::Packet> cell{kWalk};
  tests::FakeStreamTransport transport;
  transport.set_open_delay(600ms);
  utils::TimerService timers("stream");
  {
    hexapod::StreamingLoop loop{cell, transport, timers, hexapod::StreamTarget{"10.0.0.7", 80}};
    loop.start();
    std::this_thread::sleep_for(200ms);
    assert(transport.open_calls() == 1);

    const auto t0 = std::chrono::steady_clock::now();
    loop.stop(core::Packet::neutral());
    assert(std::chrono::steady_clock::now() - t0 < 100ms);
    assert(!loop.running());

    // a concurrent open_now() does not start a second connect
    assert(!loop.open_now());
    assert(transport.open_calls() == 1);

    timers.shutdown();
  }
  assert(!transport.is_open());
  assert(transport.close_calls() == 1);
  assert(transport.sent().empty());
}

int main() {
  test_opens_lazily_on_first_tick();
  test_start_twice_schedules_once();
  test_ticks_pick_up_cell_updates();
  test_stop_sends_final_then_closes();
  test_stop_without_channel_sends_nothing();
  test_failed_open_is_not_retried();
  test_open_now_then_stop();
  test_open_now_failure();
  test_send_failure_stops_streaming_until_restart();
  test_stop_during_slow_connect();
  return 0;
}
