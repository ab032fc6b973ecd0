#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace sweguard::common {

/// Shared cancellation flag. Copies observe the same flag.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true); }
  [[nodiscard]] bool is_cancelled() const { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

/// Absolute point on the steady clock after which work must stop.
class Deadline {
public:
  using Clock = std::chrono::steady_clock;

  static Deadline never() { return Deadline(Clock::time_point::max()); }
  static Deadline after(const std::chrono::milliseconds budget) {
    return Deadline(Clock::now() + budget);
  }

  [[nodiscard]] bool expired() const { return at_ != Clock::time_point::max() && Clock::now() >= at_; }
  [[nodiscard]] bool is_never() const { return at_ == Clock::time_point::max(); }

  [[nodiscard]] std::chrono::milliseconds remaining() const {
    if (is_never()) {
      return std::chrono::milliseconds::max();
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
  }

  /// The smaller of `budget` and the time left.
  [[nodiscard]] std::chrono::milliseconds clamp(const std::chrono::milliseconds budget) const {
    const auto left = remaining();
    return budget < left ? budget : left;
  }

private:
  explicit Deadline(Clock::time_point at) : at_(at) {}

  Clock::time_point at_;
};

} // namespace sweguard::common
