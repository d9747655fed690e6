#include "connection/tcp_stream_transport.hpp"
#include "utils/logger.hpp"

#include <string>

namespace connection {

TcpStreamTransport::TcpStreamTransport(std::chrono::milliseconds connect_timeout)
  : connect_timeout_(connect_timeout) {}

TcpStreamTransport::~TcpStreamTransport() noexcept {
  close();
}

bool TcpStreamTransport::open(std::string_view ip, uint16_t port) {
  close();
  peer_ = std::string(ip) + ":" + std::to_string(port);

  sock_ = TcpSocket();
  if (!sock_.is_open()) {
    logger::error() << "[TCP] Can't create socket for " << peer_;
    return false;
  }

  const ConnectResult rc = sock_.connect_to(ip, port, connect_timeout_);
  if (rc != ConnectResult::CONNECTED) {
    logger::error() << "[TCP] Can't connect to TCP socket. (" << peer_ << ") "
                    << to_string(rc);
    sock_.close();
    return false;
  }

  connected_ = true;
  logger::info() << "[TCP] Connected to " << peer_;
  return true;
}

void TcpStreamTransport::close() noexcept {
  if (connected_) {
    logger::info() << "[TCP] Closing connection to " << peer_;
  }
  connected_ = false;
  sock_.close();
}

bool TcpStreamTransport::is_open() const noexcept {
  return connected_ && sock_.is_open();
}

bool TcpStreamTransport::send(const uint8_t* data, size_t n) {
  if (!is_open()) return false;
  if (!sock_.send_all(data, n)) {
    logger::error() << "[TCP] Send to " << peer_ << " failed; dropping connection";
    close();
    return false;
  }
  drain_incoming();
  return true;
}

void TcpStreamTransport::drain_incoming() {
  uint8_t buf[512];
  for (;;) {
    size_t n = 0;
    if (!sock_.try_recv(buf, sizeof(buf), n)) {
      logger::warn() << "[TCP] Robot closed the connection (" << peer_ << ")";
      close();
      return;
    }
    if (n == 0) return;
    logger::info() << "[TCP] Received: "
                   << std::string(reinterpret_cast<const char*>(buf), n);
  }
}

} // namespace connection
