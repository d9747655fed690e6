#pragma once
#include "core/packet.hpp"
#include "hexapod/command_translator.hpp"
#include "hexapod/commands.hpp"
#include "hexapod/enums.hpp"
#include "hexapod/latest_value.hpp"
#include "utils/timer_service.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace hexapod {

/**
 * @brief Observer of sequencer transitions.
 *
 * Callbacks are delivered in order and never under the sequencer's state lock.
 * They arrive on the thread that caused the transition (an enqueue() caller or
 * the timer thread), or on whichever thread is already delivering. Implementations must not call
 * enqueue() or reset().
 */
class ISequencerListener {
public:
  virtual ~ISequencerListener() noexcept = default;

  /// IDLE -> RUNNING, before the first packet of the sequence is installed.
  virtual void on_sequence_started() = 0;
  /// A translated packet became current.
  virtual void on_packet_installed(const core::Packet& pkt) = 0;
  /// Queue drained: the neutral packet is current and the state is IDLE again.
  virtual void on_sequence_complete(const core::Packet& neutral) = 0;
};

/**
 * @brief Drains queued Commands one at a time.
 *
 * Each command is translated, its packet installed as current, and a one-shot
 * timer armed for its duration plus a small slack. On expiry the next command
 * is installed, or the neutral packet when the queue is empty. A command whose
 * duration is not positive arms no timer and completes immediately.
 */
class Sequencer {
public:
  Sequencer(CommandTranslator translator, utils::ITimerService& timers, double slack_s = 0.1);
  ~Sequencer() noexcept;

  Sequencer(const Sequencer&) = delete;
  Sequencer& operator=(const Sequencer&) = delete;

  /// Not thread-safe with respect to running sequences; set before use.
  void set_listener(ISequencerListener* listener) noexcept { listener_ = listener; }

  /// Append a command; when idle the first command is installed before returning.
  /// Never waits for a listener that is busy on another thread.
  void enqueue(Command cmd);

  /**
   * @brief Abort the current sequence.
   *
   * Cancels the pending duration timer, clears the queue, installs the neutral
   * packet and returns to IDLE. Waits for a delivery in progress to finish and
   * discards undelivered notifications; no completion callback is delivered.
   * @return true if a sequence was running.
   */
  bool reset() noexcept;

  RobotState state() const;
  size_t pending() const;
  uint64_t executed() const;

  core::Packet current_packet() const { return current_.load(); }

  /// The cell the streaming loop reads from. Only the sequencer writes it.
  const LatestValue<core::Packet>& packet_cell() const noexcept { return current_; }

private:
  struct Event {
    enum class Kind : uint8_t { STARTED, INSTALLED, COMPLETE };
    Kind kind{Kind::STARTED};
    core::Packet packet{};
  };

  void run_queue_locked();
  void finish_locked();
  void on_duration_expired(uint64_t generation);
  void deliver_events();
  void dispatch(const Event& ev);

  const CommandTranslator translator_;
  utils::ITimerService& timers_;
  const double slack_s_;
  ISequencerListener* listener_{nullptr};

  std::mutex deliver_mtx_;  // held by the one thread currently running callbacks

  mutable std::mutex mtx_;
  std::deque<Command> queue_;
  std::deque<Event> events_;  // transitions not yet handed to the listener
  RobotState state_{RobotState::IDLE};
  utils::TimerId timer_{utils::kNoTimer};
  uint64_t generation_{0};  // bumped on every arm/reset; stale expiries are ignored
  uint64_t executed_{0};

  LatestValue<core::Packet> current_{core::Packet::neutral()};
};

} // namespace hexapod
