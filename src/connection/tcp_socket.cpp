#include "connection/tcp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace connection {

static bool set_nonblocking_fd(int fd, bool on) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  if (on) {
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
  }
  return fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) == 0;
}

static int poll_timeout_ms(std::chrono::milliseconds timeout) {
  if (timeout.count() < 0) return 0;
  return static_cast<int>(timeout.count());
}

const char* to_string(ConnectResult r) noexcept {
  switch (r) {
    case ConnectResult::CONNECTED:   return "connected";
    case ConnectResult::TIMEOUT:     return "timeout";
    case ConnectResult::REFUSED:     return "error";
    case ConnectResult::BAD_ADDRESS: return "bad address";
  }
  return "unknown";
}

TcpSocket::TcpSocket() {
  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
}

TcpSocket::~TcpSocket() noexcept {
  close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept {
  fd_ = std::exchange(other.fd_, -1);
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this == &other) return *this;
  close();
  fd_ = std::exchange(other.fd_, -1);
  return *this;
}

void TcpSocket::close() noexcept {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
}

ConnectResult TcpSocket::connect_to(std::string_view ip, uint16_t port,
                                    std::chrono::milliseconds timeout) {
  if (fd_ < 0) return ConnectResult::REFUSED;

  ::sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string ip_str(ip);
  if (inet_pton(AF_INET, ip_str.c_str(), &addr.sin_addr) != 1) return ConnectResult::BAD_ADDRESS;

  if (!set_nonblocking_fd(fd_, true)) return ConnectResult::REFUSED;

  if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == 0) return ConnectResult::CONNECTED;
  if (errno != EINPROGRESS) return ConnectResult::REFUSED;

  ::pollfd fds{};
  fds.fd = fd_;
  fds.events = POLLOUT;
  int rc = 0;
  do {
    rc = ::poll(&fds, 1, poll_timeout_ms(timeout));
  } while (rc < 0 && errno == EINTR);

  if (rc == 0) return ConnectResult::TIMEOUT;
  if (rc < 0) return ConnectResult::REFUSED;

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
    return ConnectResult::REFUSED;
  }
  return ConnectResult::CONNECTED;
}

bool TcpSocket::bind_listen(std::string_view local_addr, uint16_t local_port, int backlog) {
  if (fd_ < 0) return false;

  int reuse = 1;
  (void)setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  ::sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(local_port);
  const std::string ip_str(local_addr);
  if (inet_pton(AF_INET, ip_str.c_str(), &addr.sin_addr) != 1) return false;

  if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) != 0) return false;
  return ::listen(fd_, backlog) == 0;
}

bool TcpSocket::accept_client(TcpSocket& out, bool nonblocking) {
  if (fd_ < 0) return false;

  int cfd = -1;
  for (;;) {
    cfd = ::accept(fd_, nullptr, nullptr);
    if (cfd >= 0) break;
    if (errno == EINTR) continue;
    return false; // includes EAGAIN on a non-blocking listener
  }

  if (nonblocking) {
    if (!set_nonblocking_fd(cfd, true)) {
      ::close(cfd);
      return false;
    }
  }

  out.close();
  out.fd_ = cfd;
  return true;
}

bool TcpSocket::set_nonblocking(bool on) {
  if (fd_ < 0) return false;
  return set_nonblocking_fd(fd_, on);
}

uint16_t TcpSocket::local_port() const noexcept {
  if (fd_ < 0) return 0;
  ::sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, (sockaddr*)&addr, &len) != 0) return 0;
  return ntohs(addr.sin_port);
}

bool TcpSocket::send_all(const void* data, size_t len) const {
  if (fd_ < 0) return false;
  const uint8_t* p = static_cast<const uint8_t*>(data);
  size_t sent = 0;
  while (sent < len) {
    const ssize_t n = ::send(fd_, p + sent, len - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // wait until writable
      ::pollfd fds{};
      fds.fd = fd_;
      fds.events = POLLOUT;
      const int rc = ::poll(&fds, 1, 50);
      if (rc <= 0) return false;
      continue;
    }
    return false; // other error
  }
  return true;
}

bool TcpSocket::try_recv(void* data, size_t len, size_t& out_nbytes) const {
  out_nbytes = 0;
  if (fd_ < 0) return false;
  const ssize_t n = ::recv(fd_, data, len, 0);
  if (n < 0) {
    // Non-blocking socket: no data available right now.
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
  }
  if (n == 0) {
    // Peer closed.
    return false;
  }
  out_nbytes = static_cast<size_t>(n);
  return true;
}

bool TcpSocket::wait_readable(std::chrono::milliseconds timeout) const {
  if (fd_ < 0) return false;
  ::pollfd fds{};
  fds.fd = fd_;
  fds.events = POLLIN;
  int rc = 0;
  do {
    rc = ::poll(&fds, 1, poll_timeout_ms(timeout));
  } while (rc < 0 && errno == EINTR);
  return rc > 0;
}

} // namespace connection
