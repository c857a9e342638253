#pragma once
#include <string>
#include <utility>

namespace jobqueue {

// Outcome of one execution attempt. Values are stable: they are what the
// manager records for a finished attempt.
enum class RunResult {
  Success = 1,         // completed without error
  FailRunLimit = 2,    // failed and may not run again (policy or retry limit)
  FailForCancel = 3,   // failed after the job was cancelled
  TryAgain = 4,        // failed, retry requested
  FailShouldReRun = 5  // failed, job-level predicate vetoed the retry
};

const char* to_string(RunResult r);

// Success, FailRunLimit and FailForCancel end the job.
bool is_terminal(RunResult r);

// What a job's business logic reports for one attempt.
struct JobResult {
  bool ok = true;
  std::string error;

  static JobResult Success() { return JobResult{true, ""}; }
  static JobResult Failure(std::string msg) { return JobResult{false, std::move(msg)}; }
};

} // namespace jobqueue
