#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>

namespace burrow {

/// Shared cancellation signal. Set once; every loop and sleep observes it.
class run_control {
public:
  using hook_fn = std::function<void()>;

  run_control() = default;
  run_control(const run_control &) = delete;
  run_control &operator=(const run_control &) = delete;

  /// The stop hook runs under the lock so that clear_stop_hook() returning
  /// guarantees the hook is no longer executing.
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (stopped_.exchange(true)) {
        return;
      }
      if (hook_) {
        hook_();
      }
    }
    cv_.notify_all();
  }

  bool stopped() const { return stopped_.load(); }

  /// Sleep for `duration` unless stopped first. Returns true if stopped.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> duration) const {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, duration, [this]() { return stopped_.load(); });
  }

  /// Install the action run by stop(), typically interrupting a blocked
  /// channel read. Runs immediately if already stopped.
  void set_stop_hook(hook_fn hook) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (!stopped_.load()) {
        hook_ = std::move(hook);
        return;
      }
    }
    if (hook) {
      hook();
    }
  }

  void clear_stop_hook() {
    std::lock_guard<std::mutex> lock(mu_);
    hook_ = nullptr;
  }

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::atomic<bool> stopped_{false};
  hook_fn hook_;
};

} // namespace burrow
