#pragma once
#include <chrono>
#include <optional>

namespace jobqueue {

enum class BackoffType {
  None,
  Fixed,
  Exponential
};

// Backoff for the given run count (1 based, the attempt that just failed).
// Run count 0 or a base of 0ms gives no delay. The result never exceeds cap.
// A cap of 0ms means no cap; the result then saturates at milliseconds::max().
std::chrono::milliseconds compute_backoff_delay(int run_count, BackoffType type,
                                                std::chrono::milliseconds base,
                                                std::chrono::milliseconds cap);

// Returned by a job when an attempt fails; tells the manager whether and how
// to run it again.
class RetryConstraint {
public:
  explicit RetryConstraint(bool retry) : retry_(retry) {}

  static RetryConstraint Retry() { return RetryConstraint(true); }
  static RetryConstraint Cancel() { return RetryConstraint(false); }

  // Retry after initial_delay * 2^(run_count - 1).
  static RetryConstraint exponential_backoff(int run_count, std::chrono::milliseconds initial_delay);

  bool should_retry() const { return retry_; }
  void set_retry(bool retry) { retry_ = retry; }

  const std::optional<std::chrono::milliseconds>& new_delay() const { return new_delay_; }
  void set_new_delay(std::chrono::milliseconds delay) { new_delay_ = delay; }

  const std::optional<int>& new_priority() const { return new_priority_; }
  void set_new_priority(int priority) { new_priority_ = priority; }

  // When set, new_delay is applied to every queued job of the same group.
  bool apply_delay_to_group() const { return apply_delay_to_group_; }
  void set_apply_delay_to_group(bool on) { apply_delay_to_group_ = on; }

private:
  bool retry_;
  std::optional<std::chrono::milliseconds> new_delay_;
  std::optional<int> new_priority_;
  bool apply_delay_to_group_{false};
};

} // namespace jobqueue
