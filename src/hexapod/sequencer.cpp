#include "hexapod/sequencer.hpp"
#include "utils/logger.hpp"

#include <chrono>
#include <cmath>
#include <utility>

namespace hexapod {

namespace {

// ~31 years; far inside what steady_clock can add to now() without overflow.
constexpr double kMaxTimerSeconds = 1.0e9;

utils::ITimerService::Duration to_timer_duration(double seconds) {
  if (!std::isfinite(seconds) || seconds > kMaxTimerSeconds) seconds = kMaxTimerSeconds;
  return std::chrono::duration_cast<utils::ITimerService::Duration>(
    std::chrono::duration<double>(seconds));
}

} // namespace

Sequencer::Sequencer(CommandTranslator translator, utils::ITimerService& timers, double slack_s)
  : translator_(std::move(translator)), timers_(timers), slack_s_(slack_s) {}

Sequencer::~Sequencer() noexcept {
  std::scoped_lock lk(mtx_);
  timers_.cancel(timer_);
  ++generation_;
}

void Sequencer::enqueue(Command cmd) {
  {
    std::scoped_lock lk(mtx_);
    logger::debug() << "[SEQ] Pushed " << describe(cmd);
    queue_.push_back(std::move(cmd));
    if (state_ == RobotState::IDLE) {
      run_queue_locked();
    }
  }
  deliver_events();
}

bool Sequencer::reset() noexcept {
  std::scoped_lock dl(deliver_mtx_);
  std::scoped_lock lk(mtx_);
  const bool was_running = state_ == RobotState::RUNNING;

  timers_.cancel(timer_);
  timer_ = utils::kNoTimer;
  ++generation_;

  if (!queue_.empty()) {
    logger::info() << "[SEQ] Dropping " << queue_.size() << " queued command(s)";
  }
  queue_.clear();
  events_.clear();
  current_.store(core::Packet::neutral());
  state_ = RobotState::IDLE;
  return was_running;
}

RobotState Sequencer::state() const {
  std::scoped_lock lk(mtx_);
  return state_;
}

size_t Sequencer::pending() const {
  std::scoped_lock lk(mtx_);
  return queue_.size();
}

uint64_t Sequencer::executed() const {
  std::scoped_lock lk(mtx_);
  return executed_;
}

void Sequencer::run_queue_locked() {
  while (!queue_.empty()) {
    const Command cmd = std::move(queue_.front());
    queue_.pop_front();

    if (state_ == RobotState::IDLE) {
      logger::debug() << "[SEQ] Run queue";
      state_ = RobotState::RUNNING;
      events_.push_back(Event{Event::Kind::STARTED, {}});
    }

    const Translation t = translator_.translate(cmd);
    current_.store(t.packet);
    ++executed_;
    logger::debug() << "[SEQ] " << to_string(cmd.kind) << " -> "
                    << core::to_string(t.packet) << " for " << t.duration_s << " s";
    events_.push_back(Event{Event::Kind::INSTALLED, t.packet});

    if (t.duration_s > 0.0) {
      const uint64_t gen = ++generation_;
      timer_ = timers_.schedule_once(to_timer_duration(t.duration_s + slack_s_),
                                     [this, gen] { on_duration_expired(gen); });
      return;
    }
    // Zero-duration command: complete now and fall through to the next one.
  }

  if (state_ == RobotState::RUNNING) finish_locked();
}

void Sequencer::finish_locked() {
  logger::debug() << "[SEQ] Done with the queue";
  const core::Packet neutral = core::Packet::neutral();
  current_.store(neutral);
  state_ = RobotState::IDLE;
  timer_ = utils::kNoTimer;
  events_.push_back(Event{Event::Kind::COMPLETE, neutral});
}

void Sequencer::on_duration_expired(uint64_t generation) {
  {
    std::scoped_lock lk(mtx_);
    if (generation != generation_ || state_ != RobotState::RUNNING) return;

    timer_ = utils::kNoTimer;
    if (!queue_.empty()) logger::debug() << "[SEQ] Next command";
    run_queue_locked();
  }
  deliver_events();
}

void Sequencer::deliver_events() {
  for (;;) {
    std::unique_lock dl(deliver_mtx_, std::try_to_lock);
    if (!dl.owns_lock()) return; // the thread delivering now picks ours up too

    for (;;) {
      Event ev;
      {
        std::scoped_lock lk(mtx_);
        if (events_.empty()) break;
        ev = std::move(events_.front());
        events_.pop_front();
      }
      dispatch(ev);
    }
    dl.unlock();

    // An event queued between the last check and unlock() found the lock taken.
    std::scoped_lock lk(mtx_);
    if (events_.empty()) return;
  }
}

void Sequencer::dispatch(const Event& ev) {
  if (!listener_) return;
  switch (ev.kind) {
    case Event::Kind::STARTED:   listener_->on_sequence_started(); break;
    case Event::Kind::INSTALLED: listener_->on_packet_installed(ev.packet); break;
    case Event::Kind::COMPLETE:  listener_->on_sequence_complete(ev.packet); break;
  }
}

} // namespace hexapod
