#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace jobflow {

// Read side of a cancel flag handed to the blocking polls. A default-constructed
// token is never cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

  // Sleeps in slices of at most kSlice. False when cancelled before
  // `duration` elapsed.
  auto sleep_for(std::chrono::milliseconds duration) const -> bool {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!is_cancelled()) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return true;
      }
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      std::this_thread::sleep_for(std::min(remaining, kSlice));
    }
    return false;
  }

  static constexpr std::chrono::milliseconds kSlice{20};

private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
      : flag_(std::move(flag)) {
  }

  std::shared_ptr<const std::atomic<bool>> flag_;
};

class CancellationSource {
public:
  [[nodiscard]] auto token() const -> CancellationToken {
    return CancellationToken{flag_};
  }
  auto cancel() noexcept -> void {
    flag_->store(true, std::memory_order_release);
  }

private:
  std::shared_ptr<std::atomic<bool>> flag_ =
      std::make_shared<std::atomic<bool>>(false);
};

}  // namespace jobflow
