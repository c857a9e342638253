#include "jobqueue/types.h"

namespace jobqueue {

const char* to_string(JobStatus s) {
  switch (s) {
    case JobStatus::Unknown: return "Unknown";
    case JobStatus::WaitingNotReady: return "WaitingNotReady";
    case JobStatus::WaitingReady: return "WaitingReady";
    case JobStatus::Running: return "Running";
    case JobStatus::Succeeded: return "Succeeded";
    case JobStatus::Failed: return "Failed";
    case JobStatus::Cancelled: return "Cancelled";
    default: return "Unknown";
  }
}

} // namespace jobqueue
