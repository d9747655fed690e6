#include "connection/http_echo_transport.hpp"
#include "connection/tcp_socket.hpp"
#include "utils/base64.hpp"
#include "utils/logger.hpp"

#include <span>
#include <utility>

namespace connection {

HttpEchoTransport::HttpEchoTransport(std::string ip, uint16_t port,
                                     std::chrono::milliseconds timeout)
  : ip_(std::move(ip)), port_(port), timeout_(timeout) {
  worker_ = std::thread(&HttpEchoTransport::worker_loop, this);
}

HttpEchoTransport::~HttpEchoTransport() noexcept {
  {
    std::scoped_lock lk(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

std::string HttpEchoTransport::request_path(const uint8_t* data, size_t n) {
  // The robot's endpoint reads the raw base64 text; it is not URL-encoded.
  return "/send?raw=" + utils::base64_encode(std::span<const uint8_t>(data, n));
}

void HttpEchoTransport::send_once(const uint8_t* data, size_t n) {
  std::string path = request_path(data, n);
  {
    std::scoped_lock lk(mtx_);
    if (pending_.size() >= kMaxPending) {
      pending_.pop_front();
      failed_.fetch_add(1, std::memory_order_relaxed);
      logger::debug() << "[HTTP] Echo queue full; dropped oldest request";
    }
    pending_.push_back(std::move(path));
  }
  cv_.notify_one();
}

void HttpEchoTransport::worker_loop() {
  while (true) {
    std::string path;
    {
      std::unique_lock lk(mtx_);
      cv_.wait(lk, [&] { return stop_ || !pending_.empty(); });
      if (pending_.empty() && stop_) break;
      if (pending_.empty()) continue;
      path = std::move(pending_.front());
      pending_.pop_front();
    }
    perform(path);
  }
}

void HttpEchoTransport::perform(const std::string& path) {
  const std::string url = "http://" + ip_ + ":" + std::to_string(port_) + path;

  TcpSocket sock;
  const ConnectResult rc = sock.connect_to(ip_, port_, timeout_);
  if (rc != ConnectResult::CONNECTED) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    logger::debug() << "[HTTP] HTTP error: connect " << to_string(rc) << " (" << url << ")";
    return;
  }

  const std::string request =
    "GET " + path + " HTTP/1.1\r\n"
    "Host: " + ip_ + ":" + std::to_string(port_) + "\r\n"
    "Connection: close\r\n"
    "\r\n";
  if (!sock.send_all(request.data(), request.size())) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    logger::debug() << "[HTTP] HTTP error: send failed (" << url << ")";
    return;
  }

  // Only the status line is of interest; the body is ignored.
  std::string response;
  char buf[256];
  while (response.find("\r\n") == std::string::npos && response.size() < 1024) {
    if (!sock.wait_readable(timeout_)) break;
    size_t got = 0;
    if (!sock.try_recv(buf, sizeof(buf), got) || got == 0) break;
    response.append(buf, got);
  }

  const auto eol = response.find("\r\n");
  const std::string status = response.substr(0, eol == std::string::npos ? response.size() : eol);
  if (status.rfind("HTTP/", 0) != 0) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    logger::debug() << "[HTTP] HTTP error: no response (" << url << ")";
    return;
  }

  ok_.fetch_add(1, std::memory_order_relaxed);
  logger::debug() << "[HTTP] GET " << url << " -> " << status;
}

} // namespace connection
