#pragma once

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>

namespace burrow {

using delay_schedule = std::vector<std::chrono::milliseconds>;

inline delay_schedule default_backoff_schedule() {
  using std::chrono::seconds;
  return {seconds(1),  seconds(2),  seconds(4), seconds(8),
          seconds(15), seconds(30), seconds(60)};
}

/// Reconnect attempt counter over a fixed, capped delay schedule.
class reconnect_state {
public:
  explicit reconnect_state(delay_schedule schedule = default_backoff_schedule())
      : schedule_(std::move(schedule)) {
    if (schedule_.empty()) {
      throw std::invalid_argument("backoff schedule is empty");
    }
    if (!std::is_sorted(schedule_.begin(), schedule_.end())) {
      throw std::invalid_argument("backoff schedule must not decrease");
    }
  }

  /// schedule[min(attempt, len - 1)]
  std::chrono::milliseconds delay_for(size_t attempt) const {
    return schedule_[std::min(attempt, schedule_.size() - 1)];
  }

  std::chrono::milliseconds next_delay() const { return delay_for(attempt_); }

  /// Count a failed or dropped connection.
  void record_failure() { ++attempt_; }

  /// Only a successful authentication resets the counter.
  void reset() { attempt_ = 0; }

  size_t attempt() const { return attempt_; }
  const delay_schedule &schedule() const { return schedule_; }

private:
  delay_schedule schedule_;
  size_t attempt_ = 0;
};

} // namespace burrow
