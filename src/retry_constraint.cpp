#include "jobqueue/retry_constraint.h"

#include <algorithm>

namespace jobqueue {

std::chrono::milliseconds compute_backoff_delay(int run_count, BackoffType type,
                                                std::chrono::milliseconds base,
                                                std::chrono::milliseconds cap) {
  if (run_count <= 0) return std::chrono::milliseconds(0);
  if (base.count() <= 0) return std::chrono::milliseconds(0);
  if (type == BackoffType::None) return std::chrono::milliseconds(0);

  std::chrono::milliseconds delay{0};

  if (type == BackoffType::Fixed) {
    delay = base;
  } else if (type == BackoffType::Exponential) {
    const int exp = std::min(std::max(0, run_count - 1), 20);
    const auto mult = static_cast<std::chrono::milliseconds::rep>(1LL << exp);
    if (base.count() > std::chrono::milliseconds::max().count() / mult) {
      delay = std::chrono::milliseconds::max();
    } else {
      delay = std::chrono::milliseconds(base.count() * mult);
    }
  }

  if (cap.count() > 0 && delay > cap) delay = cap;
  return delay;
}

RetryConstraint RetryConstraint::exponential_backoff(int run_count,
                                                     std::chrono::milliseconds initial_delay) {
  RetryConstraint constraint(true);
  // uncapped: the job asked for this delay explicitly
  constraint.set_new_delay(compute_backoff_delay(run_count, BackoffType::Exponential,
                                                 initial_delay, std::chrono::milliseconds(0)));
  return constraint;
}

} // namespace jobqueue
