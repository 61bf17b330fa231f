#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

namespace Common {

/**
 * Cancellation flag plus optional deadline, shared by copies.
 *
 * A Context derived with withTimeout() shares the parent's cancel flag and
 * keeps the earlier of the two deadlines. Deadlines saturate at "none".
 */
class Context {
public:
  using Clock = std::chrono::steady_clock;

  static auto background() -> Context {
    return Context(std::make_shared<std::atomic<bool>>(false), Clock::time_point::max());
  }

  static auto timeoutFromNow(std::chrono::milliseconds timeout) -> Context {
    return background().withTimeout(timeout);
  }

  [[nodiscard]] auto withTimeout(std::chrono::milliseconds timeout) const -> Context {
    const auto candidate = deadlineAfter(Clock::now(), timeout);
    return Context(cancelled_, candidate < deadline_ ? candidate : deadline_);
  }

  // Cancels every copy sharing this flag, including the parent.
  void cancel() const noexcept { cancelled_->store(true, std::memory_order_release); }

  [[nodiscard]] bool isCancelled() const noexcept {
    return cancelled_->load(std::memory_order_acquire);
  }

  [[nodiscard]] bool hasDeadline() const noexcept { return deadline_ != Clock::time_point::max(); }

  [[nodiscard]] bool isExpired() const noexcept {
    return hasDeadline() && Clock::now() >= deadline_;
  }

  [[nodiscard]] bool isDone() const noexcept { return isCancelled() || isExpired(); }

  // Time left before the deadline; max() when there is none.
  [[nodiscard]] auto remaining() const noexcept -> std::chrono::milliseconds {
    if (!hasDeadline()) {
      return std::chrono::milliseconds::max();
    }
    const auto now = Clock::now();
    if (now >= deadline_) {
      return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
  }

  [[nodiscard]] auto deadline() const noexcept -> Clock::time_point { return deadline_; }

private:
  static auto deadlineAfter(Clock::time_point now, std::chrono::milliseconds timeout) noexcept
      -> Clock::time_point {
    if (timeout <= std::chrono::milliseconds::zero()) {
      return now;
    }
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now);
    if (timeout >= headroom) {
      return Clock::time_point::max();
    }
    return now + timeout;
  }

  Context(std::shared_ptr<std::atomic<bool>> cancelled, Clock::time_point deadline)
      : cancelled_(std::move(cancelled)), deadline_(deadline) {}

  std::shared_ptr<std::atomic<bool>> cancelled_;
  Clock::time_point deadline_;
};

} // namespace Common
