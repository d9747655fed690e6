#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace connection {

/**
 * @brief Persistent byte channel to the robot (the 10 Hz packet stream).
 *
 * Implementations report connect/timeout/error events through the logger and
 * never retry on their own. The interface lets tests inject a fake backend
 * without touching the sequencing logic.
 */
class IStreamTransport {
public:
  virtual ~IStreamTransport() noexcept = default;

  virtual bool open(std::string_view ip, uint16_t port) = 0;
  virtual void close() noexcept = 0;
  virtual bool is_open() const noexcept = 0;

  virtual bool send(const uint8_t* data, size_t n) = 0;

  bool send(std::span<const uint8_t> data) { return send(data.data(), data.size()); }
};

/**
 * @brief Fire-and-forget request channel (out-of-band packet echo).
 *
 * send_once() must not block the caller on the network. Failures are logged by
 * the implementation and are not reported back.
 */
class IOneShotTransport {
public:
  virtual ~IOneShotTransport() noexcept = default;

  virtual void send_once(const uint8_t* data, size_t n) = 0;

  void send_once(std::span<const uint8_t> data) { send_once(data.data(), data.size()); }
};

} // namespace connection
