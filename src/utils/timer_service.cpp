#include "utils/timer_service.hpp"
#include "utils/logger.hpp"

#include <exception>
#include <utility>

namespace utils {

namespace {

// ~100 years: clock::now() plus this cannot overflow the nanosecond time_point.
constexpr auto kMaxDelay = std::chrono::duration_cast<ITimerService::Duration>(
  std::chrono::hours(24 * 365 * 100));

ITimerService::Duration clamp_delay(ITimerService::Duration d) {
  if (d < ITimerService::Duration::zero()) return ITimerService::Duration::zero();
  return d > kMaxDelay ? kMaxDelay : d;
}

} // namespace

TimerService::TimerService(std::string name)
  : name_(std::move(name)) {
  worker_ = std::thread(&TimerService::worker_loop, this);
}

TimerService::~TimerService() noexcept {
  shutdown();
}

TimerId TimerService::schedule_once(Duration delay, Callback fn) {
  return add(delay, Duration::zero(), std::move(fn));
}

TimerId TimerService::schedule_every(Duration period, Callback fn) {
  if (period <= Duration::zero()) {
    logger::warn() << "[TIMER] " << name_ << ": non-positive period; using 1 ms";
    period = std::chrono::milliseconds(1);
  }
  return add(period, period, std::move(fn));
}

TimerId TimerService::add(Duration delay, Duration period, Callback fn) {
  delay = clamp_delay(delay);
  period = clamp_delay(period);
  TimerId id = kNoTimer;
  {
    std::scoped_lock lk(mtx_);
    if (stop_) return kNoTimer;
    id = next_id_++;
    entries_.emplace(id, Entry{clock::now() + delay, period, std::move(fn)});
  }
  cv_.notify_one();
  return id;
}

void TimerService::cancel(TimerId id) noexcept {
  if (id == kNoTimer) return;
  {
    std::scoped_lock lk(mtx_);
    entries_.erase(id);
  }
  cv_.notify_one();
}

void TimerService::shutdown() noexcept {
  {
    std::scoped_lock lk(mtx_);
    stop_ = true;
    entries_.clear();
  }
  cv_.notify_all();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
    worker_.join();
  }
}

std::uint64_t TimerService::skipped_ticks() const {
  std::scoped_lock lk(mtx_);
  return skipped_ticks_;
}

void TimerService::worker_loop() {
  std::unique_lock lk(mtx_);
  while (!stop_) {
    if (entries_.empty()) {
      cv_.wait(lk, [&] { return stop_ || !entries_.empty(); });
      continue;
    }

    // Earliest deadline; ties resolve to the older timer.
    auto next = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->second.due < next->second.due) next = it;
    }

    const auto now = clock::now();
    if (next->second.due > now) {
      cv_.wait_until(lk, next->second.due);
      continue; // re-evaluate: entries may have changed
    }

    const TimerId id = next->first;
    Callback fn = next->second.fn;

    if (next->second.period == Duration::zero()) {
      entries_.erase(next);
    } else {
      auto& e = next->second;
      e.due += e.period;
      if (now >= e.due) {
        // overrun: skip ahead instead of catching up in a burst
        const auto missed = static_cast<std::uint64_t>((now - e.due) / e.period) + 1;
        skipped_ticks_ += missed;
        e.due = now + e.period;
      }
    }

    lk.unlock();
    try {
      fn();
    } catch (const std::exception& ex) {
      logger::error() << "[TIMER] " << name_ << ": timer " << id << " threw: " << ex.what();
    }
    lk.lock();
  }
}

} // namespace utils
