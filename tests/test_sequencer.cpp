#include "hexapod/sequencer.hpp"
#include "fake_timer_service.hpp"

#include <cassert>
#include <chrono>
#include <limits>
#include <vector>

using hexapod::Command;
using hexapod::CommandKind;
using hexapod::RobotState;

namespace {

struct RecordingListener final : hexapod::ISequencerListener {
  int started{0};
  int completed{0};
  std::vector<core::Packet> installed;

  void on_sequence_started() override { ++started; }
  void on_packet_installed(const core::Packet& pkt) override { installed.push_back(pkt); }
  void on_sequence_complete(const core::Packet& neutral) override {
    assert(neutral == core::Packet::neutral());
    ++completed;
  }
};

const auto kForward = core::Packet::build({.power = 100, .duration = 650});
const auto kTurnLeft = core::Packet::build({.rotation = -100, .duration = 162});

} // namespace

static void test_enqueue_while_idle_installs_synchronously() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);
  RecordingListener l;
  seq.set_listener(&l);

  assert(seq.state() == RobotState::IDLE);
  assert(seq.current_packet() == core::Packet::neutral());

  seq.enqueue(Command::make(CommandKind::MOVE_FORWARD, 1.0));
  assert(seq.state() == RobotState::RUNNING);
  assert(seq.current_packet() == kForward);
  assert(l.started == 1);
  assert(l.installed.size() == 1);
  assert(timers.active() == 1);
}

static void test_timer_includes_slack() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);

  seq.enqueue(Command::make(CommandKind::MOVE_FORWARD, 1.0));
  const auto armed = timers.next_oneshot_in();
  assert(armed > std::chrono::milliseconds(13099) && armed <= std::chrono::milliseconds(13100));

  timers.advance_ms(13099);
  assert(seq.current_packet() == kForward);
  assert(seq.state() == RobotState::RUNNING);

  timers.advance_ms(2);
  assert(seq.current_packet() == core::Packet::neutral());
  assert(seq.state() == RobotState::IDLE);
}

static void test_enqueue_while_running_does_not_preempt() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);

  seq.enqueue(Command::make(CommandKind::MOVE_FORWARD, 1.0));
  seq.enqueue(Command::make(CommandKind::TURN_LEFT, 90.0));
  assert(seq.current_packet() == kForward);
  assert(seq.pending() == 1);
  assert(timers.scheduled() == 1);
}

static void test_two_command_sequence() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);
  RecordingListener l;
  seq.set_listener(&l);

  seq.enqueue(Command::make(CommandKind::MOVE_FORWARD, 1.0));
  seq.enqueue(Command::make(CommandKind::TURN_LEFT, 90.0));

  timers.advance_ms(13101);
  assert(seq.current_packet() == kTurnLeft);
  assert(seq.state() == RobotState::RUNNING);
  assert(seq.pending() == 0);

  timers.advance_ms(3348);   // 3.25 s + 0.1 s slack, minus a little
  assert(seq.current_packet() == kTurnLeft);

  timers.advance_ms(3);
  assert(seq.state() == RobotState::IDLE);
  assert(seq.current_packet() == core::Packet::neutral());

  assert(l.started == 1);
  assert(l.completed == 1);
  assert(l.installed.size() == 2);
  assert(l.installed[0] == kForward && l.installed[1] == kTurnLeft);
  assert(seq.executed() == 2);
  assert(timers.active() == 0);
}

static void test_zero_duration_rest_completes_immediately() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);
  RecordingListener l;
  seq.set_listener(&l);

  seq.enqueue(Command::make(CommandKind::REST, 0.0));
  assert(seq.state() == RobotState::IDLE);
  assert(seq.current_packet() == core::Packet::neutral());
  assert(timers.scheduled() == 0);
  assert(l.started == 1 && l.completed == 1);
  assert(l.installed.size() == 1 && l.installed[0] == core::Packet::neutral());
}

static void test_zero_duration_command_mid_queue() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);
  RecordingListener l;
  seq.set_listener(&l);

  seq.enqueue(Command::make(CommandKind::TILT_LEFT, 1.0));
  seq.enqueue(Command::make(CommandKind::REST, 0.0));
  seq.enqueue(Command::make(CommandKind::TILT_RIGHT, 1.0));

  timers.advance_ms(1101);
  // rest(0) installed and passed straight through to tilt_right
  assert(l.installed.size() == 3);
  assert(l.installed[1] == core::Packet::neutral());
  assert(seq.current_packet().acc_y() == 30);
  assert(seq.state() == RobotState::RUNNING);
  assert(l.completed == 0);

  timers.advance_ms(1101);
  assert(seq.state() == RobotState::IDLE);
  assert(l.completed == 1);
  assert(timers.scheduled() == 2);
}

static void test_reset_mid_sequence() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);
  RecordingListener l;
  seq.set_listener(&l);

  seq.enqueue(Command::make(CommandKind::MOVE_FORWARD, 1.0));
  seq.enqueue(Command::make(CommandKind::MOVE_BACK, 1.0));
  timers.advance_ms(500);

  assert(seq.reset());
  assert(seq.state() == RobotState::IDLE);
  assert(seq.pending() == 0);
  assert(seq.current_packet() == core::Packet::neutral());
  assert(timers.active() == 0);

  timers.advance_ms(60000);
  assert(l.installed.size() == 1);
  assert(l.completed == 0);
  assert(!seq.reset());

  // usable again afterwards
  seq.enqueue(Command::make(CommandKind::TURN_RIGHT, 90.0));
  assert(seq.state() == RobotState::RUNNING);
  assert(l.started == 2);
}

static void test_custom_packet_duration_drives_timer() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers, 0.0);

  const auto pkt = core::Packet::build({.power = 20, .duration = 25});
  seq.enqueue(Command::custom(pkt));
  assert(seq.current_packet() == pkt);
  assert(timers.next_oneshot_in() == std::chrono::milliseconds(500));

  timers.advance_ms(500);
  assert(seq.state() == RobotState::IDLE);
}

static void test_huge_duration_is_clamped() {
  const auto thirty_years = std::chrono::hours(24 * 365 * 30);
  for (const double metres : {1.0e9, std::numeric_limits<double>::infinity()}) {
    tests::FakeTimerService timers;
    hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);

    seq.enqueue(Command::make(CommandKind::MOVE_FORWARD, metres));
    assert(seq.state() == RobotState::RUNNING);
    const auto armed = timers.next_oneshot_in();
    assert(armed > thirty_years && armed < std::chrono::hours(24 * 365 * 40));

    timers.advance_ms(200);
    assert(seq.state() == RobotState::RUNNING);
    assert(seq.reset());
  }
}

namespace {

// Reads sequencer state from inside every callback.
struct ObservingListener final : hexapod::ISequencerListener {
  hexapod::Sequencer* seq{nullptr};
  std::vector<RobotState> seen;

  void on_sequence_started() override { seen.push_back(seq->state()); }
  void on_packet_installed(const core::Packet&) override { seen.push_back(seq->state()); }
  void on_sequence_complete(const core::Packet&) override { seen.push_back(seq->state()); }
};

} // namespace

static void test_listener_runs_outside_state_lock() {
  tests::FakeTimerService timers;
  hexapod::Sequencer seq(hexapod::CommandTranslator{}, timers);
  ObservingListener l;
  l.seq = &seq;
  seq.set_listener(&l);

  seq.enqueue(Command::make(CommandKind::TILT_LEFT, 1.0));
  assert(l.seen.size() == 2);
  assert(l.seen[0] == RobotState::RUNNING && l.seen[1] == RobotState::RUNNING);

  timers.advance_ms(1101);
  assert(l.seen.size() == 3);
  assert(l.seen[2] == RobotState::IDLE);
}

int main() {
  test_enqueue_while_idle_installs_synchronously();
  test_timer_includes_slack();
  test_enqueue_while_running_does_not_preempt();
  test_two_command_sequence();
  test_zero_duration_rest_completes_immediately();
  test_zero_duration_command_mid_queue();
  test_reset_mid_sequence();
  test_custom_packet_duration_drives_timer();
  test_huge_duration_is_clamped();
  test_listener_runs_outside_state_lock();
  return 0;
}
