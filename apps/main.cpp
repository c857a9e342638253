#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "jobqueue/job_manager.h"

using namespace jobqueue;

static JobParams params(const std::string& id, int priority) {
  JobParams p;
  p.id = id;
  p.priority = priority;
  return p;
}

// Runs on the calling thread until the queue drains, sleeping while the only
// queued jobs are delayed.
static void drain(JobManager& mgr) {
  for (;;) {
    mgr.run_until_idle();
    if (mgr.count() == 0) return;

    const TimeNs wake = mgr.next_ready_time();
    if (wake == kNotDelayedJobDelay) return; // blocked on network or group
    const TimeNs now = steady_now_ns();
    if (wake > now) std::this_thread::sleep_for(std::chrono::nanoseconds(wake - now));
  }
}

int main() {
  ManagerConfig cfg = ManagerConfig::from_env();
  cfg.default_backoff = BackoffType::Exponential;
  cfg.default_backoff_base = std::chrono::milliseconds(50);
  cfg.network_available = false;

  JobManager mgr(cfg);

  // Priority demo
  for (int i = 0; i < 5; i++) {
    mgr.add_job(std::make_shared<FunctionJob>(params("low_" + std::to_string(i), 1), []() -> JobResult {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      return JobResult::Success();
    }));
  }
  mgr.add_job(std::make_shared<FunctionJob>(params("high_ping", 10), [] { return JobResult::Success(); }));

  // Cancel demo
  mgr.add_job(std::make_shared<FunctionJob>(params("cancel_me", 5), [] { return JobResult::Success(); }));
  mgr.cancel("cancel_me");

  // Retry demo
  {
    auto counter = std::make_shared<int>(0);
    mgr.add_job(std::make_shared<FunctionJob>(
        params("fails_twice_then_ok", 5),
        [counter]() -> JobResult {
          (*counter)++;
          if (*counter <= 2) return JobResult::Failure("planned fail");
          return JobResult::Success();
        },
        [](const std::string&, int run_count, int) {
          return RetryConstraint::exponential_backoff(run_count, std::chrono::milliseconds(100));
        }));
  }

  {
    JobParams p = params("always_fails", 5);
    p.retry_limit = 3;
    mgr.add_job(std::make_shared<FunctionJob>(p, []() -> JobResult {
      throw std::runtime_error("always fails");
    }));
  }

  // Group demo: these two never overlap
  for (int i = 0; i < 2; i++) {
    JobParams p = params("sync_" + std::to_string(i), 3);
    p.group_id = "sync";
    mgr.add_job(std::make_shared<FunctionJob>(p, [] { return JobResult::Success(); }));
  }

  // Network demo
  {
    JobParams p = params("upload", 8);
    p.requires_network = true;
    p.tags = TagSet{"upload", "user"};
    mgr.add_job(std::make_shared<FunctionJob>(p, [] { return JobResult::Success(); }));
  }

  std::thread worker([&mgr] { drain(mgr); });
  drain(mgr);
  worker.join();

  mgr.logger().info("offline pass done", {{"queued", std::to_string(mgr.count())}});
  mgr.set_network_available(true);
  drain(mgr);

  const auto st = mgr.stats();
  mgr.logger().info("final_metrics", {
    {"event", "final_metrics"},
    {"jobs_added", std::to_string(st.jobs_added)},
    {"jobs_succeeded", std::to_string(st.jobs_succeeded)},
    {"jobs_failed", std::to_string(st.jobs_failed)},
    {"jobs_cancelled", std::to_string(st.jobs_cancelled)},
    {"retries_performed", std::to_string(st.retries_performed)},
    {"always_fails", to_string(mgr.status("always_fails"))}
  });

  mgr.stop();
  return 0;
}
