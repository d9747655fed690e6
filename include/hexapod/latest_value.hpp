#pragma once
#include <mutex>
#include <utility>

namespace hexapod {

// Single-writer / multi-reader "latest-wins" cell.
// The value is copied under a short lock, so T need not be trivially copyable.
template <typename T>
class LatestValue {
public:
  LatestValue() = default;
  explicit LatestValue(T initial) : value_(std::move(initial)) {}

  void store(const T& v) {
    std::scoped_lock lk(mtx_);
    value_ = v;
  }

  T load() const {
    std::scoped_lock lk(mtx_);
    return value_;
  }

private:
  mutable std::mutex mtx_;
  T value_{};
};

} // namespace hexapod
