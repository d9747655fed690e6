#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace connection
{

  enum class ConnectResult : uint8_t
  {
    CONNECTED = 0,
    TIMEOUT = 1,
    REFUSED = 2,   // any immediate or reported socket error
    BAD_ADDRESS = 3,
  };

  class TcpSocket
  {
  public:
    TcpSocket();
    ~TcpSocket() noexcept;

    TcpSocket(const TcpSocket &) = delete;
    TcpSocket &operator=(const TcpSocket &) = delete;
    TcpSocket(TcpSocket &&) noexcept;
    TcpSocket &operator=(TcpSocket &&) noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    /**
     * @brief Connect with an upper bound on the handshake time.
     *
     * The socket is left non-blocking on success; send_all() waits for
     * writability itself.
     */
    [[nodiscard]] ConnectResult connect_to(std::string_view ip, uint16_t port,
                                           std::chrono::milliseconds timeout);
    [[nodiscard]] bool bind_listen(std::string_view local_addr, uint16_t local_port, int backlog = 1);
    [[nodiscard]] bool accept_client(TcpSocket &out, bool nonblocking = false);
    [[nodiscard]] bool set_nonblocking(bool on = true);
    /// Bound local port (the kernel's pick after binding port 0); 0 if unbound.
    uint16_t local_port() const noexcept;

    [[nodiscard]] bool send_all(const void *data, size_t len) const;
    [[nodiscard]] bool try_recv(void *data, size_t len, size_t &out_nbytes) const;
    /// Poll for readability; false on timeout or error.
    [[nodiscard]] bool wait_readable(std::chrono::milliseconds timeout) const;

    void close() noexcept;

  private:
    int fd_ = -1;
  };

  const char *to_string(ConnectResult r) noexcept;

} // namespace connection
