#pragma once
#include "connection/tcp_socket.hpp"
#include "connection/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace connection {

/**
 * @brief TCP implementation of the persistent packet stream.
 *
 * Anything the robot writes back is drained on each send and logged at info
 * level; the driver is open-loop and does not interpret it.
 */
class TcpStreamTransport final : public IStreamTransport {
public:
  explicit TcpStreamTransport(std::chrono::milliseconds connect_timeout = std::chrono::seconds(5));
  ~TcpStreamTransport() noexcept override;

  TcpStreamTransport(const TcpStreamTransport&) = delete;
  TcpStreamTransport& operator=(const TcpStreamTransport&) = delete;

  bool open(std::string_view ip, uint16_t port) override;
  void close() noexcept override;
  bool is_open() const noexcept override;

  bool send(const uint8_t* data, size_t n) override;
  using IStreamTransport::send;

private:
  void drain_incoming();

  std::chrono::milliseconds connect_timeout_;
  TcpSocket sock_;
  bool connected_{false};
  std::string peer_;
};

} // namespace connection
