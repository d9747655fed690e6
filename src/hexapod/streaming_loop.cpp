#include "hexapod/streaming_loop.hpp"
#include "utils/logger.hpp"

#include <exception>
#include <utility>

namespace hexapod {

StreamingLoop::StreamingLoop(const LatestValue<core::Packet>& source,
                             connection::IStreamTransport& transport,
                             utils::ITimerService& timers,
                             StreamTarget target,
                             std::chrono::milliseconds period)
  : source_(source),
    transport_(transport),
    timers_(timers),
    target_(std::move(target)),
    period_(period.count() > 0 ? period : std::chrono::milliseconds(100)) {}

StreamingLoop::~StreamingLoop() noexcept {
  std::scoped_lock lk(mtx_);
  timers_.cancel(timer_);
  ++generation_;
  running_ = false;
}

void StreamingLoop::start() {
  std::scoped_lock lk(mtx_);
  if (running_) return;

  running_ = true;
  link_down_ = false;
  close_after_connect_ = false;
  const uint64_t gen = ++generation_;
  timer_ = timers_.schedule_every(period_, [this, gen] { tick(gen); });
  logger::info() << "[STREAM] Streaming to " << target_.ip << ":" << target_.port
                 << " every " << period_.count() << " ms";
}

void StreamingLoop::stop(const core::Packet& final_packet) {
  std::scoped_lock lk(mtx_);
  const bool was_running = running_;

  timers_.cancel(timer_);
  timer_ = utils::kNoTimer;
  ++generation_;
  running_ = false;
  link_down_ = false;

  if (connecting_) {
    // The connecting thread owns the transport until open() returns.
    close_after_connect_ = true;
  } else if (transport_.is_open()) {
    const auto bytes = final_packet.serialize();
    if (transport_.send(bytes)) {
      ++packets_sent_;
    } else {
      ++send_errors_;
      logger::warn() << "[STREAM] Final packet could not be sent";
    }
    transport_.close();
  }

  if (was_running) {
    logger::info() << "[STREAM] Stopped after " << packets_sent_ << " packet(s)";
  }
}

bool StreamingLoop::open_now() {
  std::unique_lock lk(mtx_);
  if (connecting_) return false;
  link_down_ = false;
  close_after_connect_ = false;
  return ensure_open(lk);
}

bool StreamingLoop::running() const {
  std::scoped_lock lk(mtx_);
  return running_;
}

uint64_t StreamingLoop::packets_sent() const {
  std::scoped_lock lk(mtx_);
  return packets_sent_;
}

uint64_t StreamingLoop::send_errors() const {
  std::scoped_lock lk(mtx_);
  return send_errors_;
}

bool StreamingLoop::ensure_open(std::unique_lock<std::mutex>& lk) {
  if (connecting_) return false;
  if (transport_.is_open()) return true;
  if (link_down_) return false;

  connecting_ = true;
  lk.unlock();
  bool ok = false;
  try {
    ok = transport_.open(target_.ip, target_.port);
  } catch (const std::exception& e) {
    logger::error() << "[STREAM] open() threw: " << e.what();
  }
  lk.lock();
  connecting_ = false;

  if (!ok) {
    link_down_ = true;
    close_after_connect_ = false;
    logger::error() << "[STREAM] Robot unreachable at " << target_.ip << ":" << target_.port
                    << "; packets are not streamed until the next sequence";
    return false;
  }
  if (close_after_connect_) {
    close_after_connect_ = false;
    logger::debug() << "[STREAM] Stopped while connecting; closing";
    transport_.close();
    return false;
  }
  return true;
}

void StreamingLoop::tick(uint64_t generation) {
  std::unique_lock lk(mtx_);
  if (!running_ || generation != generation_) return;
  if (!ensure_open(lk)) return;
  // state may have moved on while the lock was dropped for the connect
  if (!running_ || generation != generation_) return;

  const auto bytes = source_.load().serialize();
  if (transport_.send(bytes)) {
    ++packets_sent_;
    return;
  }

  ++send_errors_;
  if (!transport_.is_open()) {
    link_down_ = true;
    logger::error() << "[STREAM] Connection lost; packets are not streamed until the next sequence";
  }
}

} // namespace hexapod
