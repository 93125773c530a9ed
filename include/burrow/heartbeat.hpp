#pragma once

#include "channel.hpp"
#include "error.hpp"
#include "protocol.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace burrow {

/// Sends `ping` on a fixed interval while a connection is ready. A failed
/// send ends the task quietly; the receive loop notices the broken channel
/// on its own.
class heartbeat_monitor {
public:
  explicit heartbeat_monitor(std::chrono::milliseconds interval)
      : interval_(interval) {}

  ~heartbeat_monitor() { stop(); }

  heartbeat_monitor(const heartbeat_monitor &) = delete;
  heartbeat_monitor &operator=(const heartbeat_monitor &) = delete;

  void start(channel &chan) {
    stop();
    {
      std::lock_guard<std::mutex> lock(mu_);
      running_ = true;
    }
    thread_ = std::thread([this, &chan]() { loop(chan); });
  }

  /// Cancel and join. No ping is sent after this returns.
  void stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  bool running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return running_;
  }

private:
  void loop(channel &chan) {
    const std::string ping = encode_outbound(ping_message{});
    std::unique_lock<std::mutex> lock(mu_);
    while (running_) {
      if (cv_.wait_for(lock, interval_, [this]() { return !running_; })) {
        return;
      }
      lock.unlock();
      try {
        chan.send_text(ping);
        spdlog::debug("heartbeat sent");
      } catch (const tunnel_error &e) {
        spdlog::debug("heartbeat stopped: {}", e.what());
        lock.lock();
        running_ = false;
        return;
      }
      lock.lock();
    }
  }

  std::chrono::milliseconds interval_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool running_ = false;
  std::thread thread_;
};

} // namespace burrow
