#include "jobqueue/job.h"

#include <exception>
#include <stdexcept>
#include <utility>

#include "jobqueue/job_record.h"
#include "jobqueue/logger.h"

namespace jobqueue {

Job::Job(JobParams params)
    : id_(std::move(params.id)),
      group_id_(std::move(params.group_id)),
      requires_network_(params.requires_network),
      tags_(std::move(params.tags)),
      delay_(params.delay),
      retry_limit_(params.retry_limit),
      priority_(params.priority) {
  if (id_.empty()) throw std::invalid_argument("job id must not be empty");
  if (retry_limit_ < 1) throw std::invalid_argument("retry limit must be at least 1");
}

RetryConstraint Job::should_re_run_on_failure(const std::string&, int, int) {
  return RetryConstraint::Retry();
}

RunResult Job::safe_run(JobRecord& record, int current_run_count) noexcept {
  JobResult res = JobResult::Failure("unknown error");
  try {
    res = on_run();
  } catch (const std::exception& e) {
    res = JobResult::Failure(std::string("exception: ") + e.what());
  } catch (...) {
    res = JobResult::Failure("exception: unknown");
  }

  if (res.ok) return RunResult::Success;

  // only the predicate's answer for this attempt is kept
  retry_constraint_.reset();

  bool re_run = false;
  const bool retries_left = current_run_count < retry_limit_;
  if (retries_left && !record.is_cancelled()) {
    try {
      retry_constraint_ = should_re_run_on_failure(res.error, current_run_count, retry_limit_);
    } catch (const std::exception& e) {
      res.error += std::string("; retry predicate threw: ") + e.what();
      retry_constraint_ = RetryConstraint::Cancel();
    } catch (...) {
      retry_constraint_ = RetryConstraint::Cancel();
    }
    re_run = retry_constraint_->should_retry();
  }

  if (ctx_.logger) {
    ctx_.logger->warn(ForJob{id_}, "attempt failed", {
      {"attempt", std::to_string(current_run_count)},
      {"error", res.error}
    });
  }

  if (record.is_cancelled()) return RunResult::FailForCancel;
  if (re_run) return RunResult::TryAgain;
  if (retries_left) return RunResult::FailShouldReRun;
  return RunResult::FailRunLimit;
}

FunctionJob::FunctionJob(JobParams params, Fn fn, RetryFn retry)
    : Job(std::move(params)), fn_(std::move(fn)), retry_(std::move(retry)) {
  if (!fn_) throw std::invalid_argument("function job needs a body");
}

JobResult FunctionJob::on_run() {
  return fn_();
}

RetryConstraint FunctionJob::should_re_run_on_failure(const std::string& error, int run_count,
                                                      int retry_limit) {
  if (!retry_) return Job::should_re_run_on_failure(error, run_count, retry_limit);
  return retry_(error, run_count, retry_limit);
}

} // namespace jobqueue
