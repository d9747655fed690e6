#pragma once
#include "connection/transport.hpp"
#include "core/packet.hpp"
#include "hexapod/enums.hpp"
#include "hexapod/runtime_config.hpp"
#include "hexapod/sequencer.hpp"
#include "hexapod/streaming_loop.hpp"
#include "utils/timer_service.hpp"

#include <cstddef>
#include <mutex>

namespace hexapod {

/**
 * @brief Public command surface for one robot connection.
 *
 * Every motion method only queues a command and returns; execution is driven by
 * the two timer services. The sequencer's timers and the stream ticks may share
 * one service, but a dedicated stream service keeps a slow connect from delaying
 * command timing.
 *
 * Both timer services must outlive the client; shut them down (or call
 * disconnect() and stop enqueueing) before destroying it.
 */
class HexapodClient final : private ISequencerListener {
public:
  HexapodClient(RuntimeConfigPtr cfg,
                connection::IStreamTransport& stream,
                connection::IOneShotTransport* echo,
                utils::ITimerService& sequence_timers,
                utils::ITimerService& stream_timers);
  ~HexapodClient() noexcept override;

  HexapodClient(const HexapodClient&) = delete;
  HexapodClient& operator=(const HexapodClient&) = delete;

  /// Open the persistent channel now rather than when the first command starts.
  bool connect();

  /**
   * @brief Host-initiated disconnect.
   *
   * Cancels the pending duration timer, stops the stream tick, clears the queue,
   * then sends one neutral packet and closes the channel. Commands issued from
   * other threads land either before or after it, never in between.
   */
  void disconnect();

  /// @param distance_m metres, must be > 0
  bool move_forward(double distance_m);
  /// @param distance_m metres, must be > 0
  bool move_back(double distance_m);
  void turn_left(double degrees);
  void turn_right(double degrees);
  void tilt_forward(double seconds);
  void tilt_back(double seconds);
  void tilt_left(double seconds);
  void tilt_right(double seconds);
  void rest(double seconds = 0.0);
  void send_custom(const core::Packet& pkt);

  /// Push a packet through the one-shot channel, outside any sequence.
  void send_packet_http(const core::Packet& pkt);

  RobotState state() const { return seq_.state(); }
  size_t pending() const { return seq_.pending(); }
  core::Packet current_packet() const { return seq_.current_packet(); }
  bool streaming() const { return stream_.running(); }

  const Sequencer& sequencer() const noexcept { return seq_; }
  const StreamingLoop& stream() const noexcept { return stream_; }
  const RuntimeConfig& config() const noexcept { return *cfg_; }

private:
  void push(Command cmd);

  void on_sequence_started() override;
  void on_packet_installed(const core::Packet& pkt) override;
  void on_sequence_complete(const core::Packet& neutral) override;

  RuntimeConfigPtr cfg_;
  connection::IOneShotTransport* echo_;
  std::mutex ops_mtx_; // push() vs disconnect(); the listener hooks never take it
  Sequencer seq_;
  StreamingLoop stream_;
};

} // namespace hexapod
