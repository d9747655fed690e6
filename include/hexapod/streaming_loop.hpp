#pragma once
#include "connection/transport.hpp"
#include "core/packet.hpp"
#include "hexapod/latest_value.hpp"
#include "utils/timer_service.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace hexapod {

struct StreamTarget {
  std::string ip;
  uint16_t port{0};
};

/**
 * @brief Ships the current packet on the persistent channel at a fixed rate.
 *
 * The loop knows nothing about commands: every tick it copies whatever packet
 * is current and sends it. The channel is opened lazily on the first tick; a
 * failed connect or send is logged once and the loop stays quiet until the next
 * start() (no retry).
 *
 * stop() and ticks are serialised, so once stop() has sent its final packet no
 * earlier tick can follow it on the wire. The connect itself runs without the
 * loop's lock: start() and stop() return at once while a tick is connecting.
 * A stop() that lands mid-connect closes the channel as soon as it opens.
 */
class StreamingLoop {
public:
  StreamingLoop(const LatestValue<core::Packet>& source,
                connection::IStreamTransport& transport,
                utils::ITimerService& timers,
                StreamTarget target,
                std::chrono::milliseconds period = std::chrono::milliseconds(100));
  ~StreamingLoop() noexcept;

  StreamingLoop(const StreamingLoop&) = delete;
  StreamingLoop& operator=(const StreamingLoop&) = delete;

  /// Begin periodic sending. No-op while already running.
  void start();

  /**
   * @brief Stop ticking, send @p final_packet once and close the channel.
   *
   * Also closes a channel opened by open_now() without any sequence running.
   */
  void stop(const core::Packet& final_packet);

  /// Open the channel immediately instead of on the first tick. Blocks for up
  /// to the transport's connect timeout; false if a tick is already connecting.
  [[nodiscard]] bool open_now();

  bool running() const;
  uint64_t packets_sent() const;
  uint64_t send_errors() const;

  std::chrono::milliseconds period() const noexcept { return period_; }

private:
  // Called with lk held; drops it around transport_.open().
  bool ensure_open(std::unique_lock<std::mutex>& lk);
  void tick(uint64_t generation);

  const LatestValue<core::Packet>& source_;
  connection::IStreamTransport& transport_;
  utils::ITimerService& timers_;
  const StreamTarget target_;
  const std::chrono::milliseconds period_;

  mutable std::mutex mtx_;
  bool running_{false};
  bool link_down_{false};   // connect or send failed since the last start()
  bool connecting_{false};  // transport_.open() in progress on some thread
  bool close_after_connect_{false};
  uint64_t generation_{0};
  utils::TimerId timer_{utils::kNoTimer};
  uint64_t packets_sent_{0};
  uint64_t send_errors_{0};
};

} // namespace hexapod
