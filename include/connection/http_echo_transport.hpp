#pragma once
#include "connection/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace connection {

/**
 * @brief One-shot packet echo over HTTP.
 *
 * Each send_once() becomes `GET /send?raw=<base64 packet>` against the robot's
 * web endpoint. Requests are queued and issued by a background worker so the
 * caller (usually the sequencer) never waits on the network. When the queue is
 * full the oldest request is dropped.
 *
 * The destructor issues whatever is still queued before joining the worker.
 */
class HttpEchoTransport final : public IOneShotTransport {
public:
  static constexpr size_t kMaxPending = 64;

  HttpEchoTransport(std::string ip, uint16_t port,
                    std::chrono::milliseconds timeout = std::chrono::seconds(2));
  ~HttpEchoTransport() noexcept override;

  HttpEchoTransport(const HttpEchoTransport&) = delete;
  HttpEchoTransport& operator=(const HttpEchoTransport&) = delete;

  void send_once(const uint8_t* data, size_t n) override;
  using IOneShotTransport::send_once;

  /// Request path for a packet, e.g. "/send?raw=UEtU...". Exposed for tests.
  static std::string request_path(const uint8_t* data, size_t n);

  uint64_t requests_ok() const noexcept { return ok_.load(std::memory_order_relaxed); }
  uint64_t requests_failed() const noexcept { return failed_.load(std::memory_order_relaxed); }

private:
  void worker_loop();
  void perform(const std::string& path);

  const std::string ip_;
  const uint16_t port_;
  const std::chrono::milliseconds timeout_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  bool stop_{false};
  std::thread worker_;

  std::atomic<uint64_t> ok_{0};
  std::atomic<uint64_t> failed_{0};
};

} // namespace connection
