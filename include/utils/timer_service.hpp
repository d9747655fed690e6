#pragma once
/**
 * @file timer_service.hpp
 * @brief Cancellable one-shot and periodic timers.
 *
 * ITimerService is the seam the sequencer and the streaming loop are written
 * against; tests drive them with a manually advanced fake.
 *
 * TimerService runs every callback on one worker thread, in deadline order, and
 * never holds its own lock while a callback runs, so callbacks may schedule or
 * cancel timers. cancel() only guarantees that a callback which has not started
 * yet will not start; owners that must tolerate an in-flight callback should
 * check their own state inside it.
 *
 * Periodic timers use a monotonic "next tick" schedule. If a tick runs late by a
 * full period or more, missed ticks are skipped rather than burst-fired.
 */
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace utils {

using TimerId = std::uint64_t;
inline constexpr TimerId kNoTimer = 0;

class ITimerService {
public:
  using Callback = std::function<void()>;
  using Duration = std::chrono::steady_clock::duration;

  virtual ~ITimerService() noexcept = default;

  virtual TimerId schedule_once(Duration delay, Callback fn) = 0;
  virtual TimerId schedule_every(Duration period, Callback fn) = 0;
  /// Unknown or already-fired ids are ignored.
  virtual void cancel(TimerId id) noexcept = 0;
};

class TimerService final : public ITimerService {
public:
  using clock = std::chrono::steady_clock;

  explicit TimerService(std::string name = "timer");
  ~TimerService() noexcept override;

  TimerService(const TimerService&) = delete;
  TimerService& operator=(const TimerService&) = delete;

  TimerId schedule_once(Duration delay, Callback fn) override;
  TimerId schedule_every(Duration period, Callback fn) override;
  void cancel(TimerId id) noexcept override;

  /// Stop the worker; pending timers are discarded. Idempotent.
  void shutdown() noexcept;

  std::uint64_t skipped_ticks() const;

private:
  struct Entry {
    clock::time_point due{};
    Duration period{};   // zero for one-shot
    Callback fn;
  };

  TimerId add(Duration delay, Duration period, Callback fn);
  void worker_loop();

  const std::string name_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::map<TimerId, Entry> entries_;
  TimerId next_id_{1};
  bool stop_{false};
  std::uint64_t skipped_ticks_{0};

  std::thread worker_;
};

} // namespace utils
