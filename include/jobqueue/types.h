#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace jobqueue {

using JobId = std::string;
using SessionId = std::int64_t;

// Monotonic nanoseconds, comparable only within one process.
using TimeNs = std::int64_t;
using Clock = std::function<TimeNs()>;

// delay_until_ns value of a record that may run immediately
constexpr TimeNs kNotDelayedJobDelay = INT64_MIN;

inline TimeNs steady_now_ns() {
  using namespace std::chrono;
  return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

// Latest deadline a delay can produce. One below the maximum so it can never
// wrap, and never equal to kNotDelayedJobDelay.
constexpr TimeNs kLatestDelayDeadline = std::numeric_limits<TimeNs>::max() - 1;

// Saturates at kLatestDelayDeadline instead of overflowing.
inline TimeNs ms_to_ns(std::chrono::milliseconds ms) {
  constexpr TimeNs kNsPerMs = 1000000;
  if (ms.count() > kLatestDelayDeadline / kNsPerMs) return kLatestDelayDeadline;
  if (ms.count() < -(kLatestDelayDeadline / kNsPerMs)) return -kLatestDelayDeadline;
  return static_cast<TimeNs>(ms.count()) * kNsPerMs;
}

// delay_until_ns for a delay starting at now: kNotDelayedJobDelay when there
// is no delay, otherwise now + delay clamped to kLatestDelayDeadline.
inline TimeNs delay_deadline(TimeNs now, std::chrono::milliseconds delay) {
  if (delay.count() <= 0) return kNotDelayedJobDelay;
  const TimeNs ns = ms_to_ns(delay);
  if (now > kLatestDelayDeadline - ns) return kLatestDelayDeadline;
  return now + ns;
}

enum class JobStatus {
  Unknown,
  WaitingNotReady,
  WaitingReady,
  Running,
  Succeeded,
  Failed,
  Cancelled
};

const char* to_string(JobStatus s);

} // namespace jobqueue
