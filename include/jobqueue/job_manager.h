#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "jobqueue/job.h"
#include "jobqueue/job_queue.h"
#include "jobqueue/job_record.h"
#include "jobqueue/logger.h"
#include "jobqueue/result.h"
#include "jobqueue/retry_constraint.h"
#include "jobqueue/types.h"

namespace jobqueue {

struct ManagerConfig {
  // Upper bound for the default backoff below.
  std::chrono::milliseconds max_backoff{5000};

  // Used when a retried job declares no delay of its own.
  // If base is 0ms, it behaves like None.
  BackoffType default_backoff{BackoffType::None};
  std::chrono::milliseconds default_backoff_base{0};

  LogLevel log_level{LogLevel::Info};
  bool json_logs{false};

  bool network_available{true};

  // Monotonic time source.
  Clock clock{steady_now_ns};

  // Defaults overridden by JOBQUEUE_LOG_LEVEL and JOBQUEUE_JSON_LOGS.
  static ManagerConfig from_env();
};

struct ManagerStats {
  std::uint64_t jobs_added{0};
  std::uint64_t jobs_succeeded{0};
  std::uint64_t jobs_failed{0};
  std::uint64_t jobs_cancelled{0};
  std::uint64_t retries_performed{0};
  std::uint64_t jobs_recovered{0};
};

// Owns the queued records of one session and runs them on whatever threads
// call run_next(). Jobs of the same group never run concurrently.
class JobManager {
public:
  explicit JobManager(ManagerConfig config = {});
  JobManager(ManagerConfig config, std::ostream& log_out);
  ~JobManager();

  JobManager(const JobManager&) = delete;
  JobManager& operator=(const JobManager&) = delete;

  SessionId session_id() const { return session_id_; }

  // Builds a record for the job and queues it.
  // Returns false if the manager is stopped or the id is already queued or
  // running.
  bool add_job(std::shared_ptr<Job> job);

  // Runs the next ready record on the calling thread and applies the
  // outcome. Returns nullopt if nothing was ready.
  std::optional<RunResult> run_next();

  // Calls run_next() until nothing is ready. Returns the number of attempts.
  std::size_t run_until_idle();

  // Queued records are dropped at once; a running record is only flagged and
  // finishes through its outcome. Returns false for unknown or finished ids.
  bool cancel(const JobId& id);

  // Requeues records left in flight by an earlier session. Records of this
  // session, and records whose id is already running or queued, are left
  // untouched. Returns the number requeued.
  std::size_t recover(const std::vector<std::shared_ptr<JobRecord>>& records);

  void set_network_available(bool available);
  bool is_network_available() const { return network_available_.load(); }

  JobStatus status(const JobId& id) const;
  bool is_successful(const JobId& id) const;

  // Queued records, running ones excluded.
  std::size_t count() const;

  // When the earliest delayed record becomes ready, kNotDelayedJobDelay if
  // none is waiting on a delay.
  TimeNs next_ready_time() const;

  ManagerStats stats() const;

  void stop();

  Logger& logger() { return logger_; }

private:
  struct Finished {
    JobStatus status{JobStatus::Unknown};
    bool requeued{false};
    bool notify_cancel{false};
    std::chrono::milliseconds delay{0};
  };

  Finished finish_attempt_(const std::shared_ptr<JobRecord>& record, RunResult res);
  std::shared_ptr<JobRecord> rebuild_for_retry_(const JobRecord& record,
                                                TimeNs now,
                                                std::chrono::milliseconds& delay) const;

  static SessionId next_session_id_(TimeNs now);

  ManagerConfig config_;
  Logger logger_;
  SessionId session_id_;

  JobQueue queue_;

  std::atomic<bool> network_available_;
  std::atomic<bool> accepting_{true};

  mutable std::mutex mtx_;
  std::unordered_map<JobId, std::shared_ptr<JobRecord>> running_;
  std::set<std::string> running_groups_;
  std::unordered_map<JobId, JobStatus> finished_;
  ManagerStats stats_{};
};

} // namespace jobqueue
