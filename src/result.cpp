#include "jobqueue/result.h"

namespace jobqueue {

const char* to_string(RunResult r) {
  switch (r) {
    case RunResult::Success: return "Success";
    case RunResult::FailRunLimit: return "FailRunLimit";
    case RunResult::FailForCancel: return "FailForCancel";
    case RunResult::TryAgain: return "TryAgain";
    case RunResult::FailShouldReRun: return "FailShouldReRun";
    default: return "Unknown";
  }
}

bool is_terminal(RunResult r) {
  return r == RunResult::Success || r == RunResult::FailRunLimit || r == RunResult::FailForCancel;
}

} // namespace jobqueue
