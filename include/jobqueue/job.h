#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>

#include "jobqueue/result.h"
#include "jobqueue/retry_constraint.h"
#include "jobqueue/types.h"

namespace jobqueue {

class JobRecord;
class Logger;

using TagSet = std::set<std::string>;

// Host execution context handed to a job once, before it runs.
struct JobContext {
  Logger* logger{nullptr};
  SessionId session_id{0};
};

struct JobParams {
  JobId id;
  int priority{0};
  std::optional<std::string> group_id;
  bool requires_network{false};
  std::optional<TagSet> tags;
  std::chrono::milliseconds delay{0}; // before the first run
  int retry_limit{20};
};

// Unit of work. Subclasses implement on_run(); the manager only ever calls
// safe_run(), which never throws.
class Job {
public:
  explicit Job(JobParams params);
  virtual ~Job() = default;

  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;

  const JobId& id() const { return id_; }
  const std::optional<std::string>& group_id() const { return group_id_; }
  std::chrono::milliseconds initial_delay() const { return delay_; }
  int retry_limit() const { return retry_limit_; }

  virtual bool requires_network() const { return requires_network_; }

  // nullptr when the job has no tags
  virtual const TagSet* tags() const { return tags_ ? &*tags_ : nullptr; }

  int priority() const { return priority_.load(); }
  void set_priority(int priority) { priority_.store(priority); }

  bool is_cancelled() const { return cancelled_.load(); }
  void mark_cancelled() { cancelled_.store(true); }

  // Answer of the predicate on the last failed attempt. Empty if it was not
  // asked, e.g. the retry limit was reached or the record was cancelled.
  const std::optional<RetryConstraint>& retry_constraint() const { return retry_constraint_; }

  void set_context(JobContext ctx) { ctx_ = ctx; }
  const JobContext& context() const { return ctx_; }

  // Runs one attempt and maps it to a RunResult:
  //   success                                   -> Success
  //   record cancelled                          -> FailForCancel
  //   should_re_run_on_failure() asks to retry  -> TryAgain
  //   retries left but the job declined         -> FailShouldReRun
  //   retry limit reached                       -> FailRunLimit
  virtual RunResult safe_run(JobRecord& record, int current_run_count) noexcept;

  virtual void on_added() {}
  virtual void on_cancel() {}

protected:
  // May throw; exceptions count as a failed attempt.
  virtual JobResult on_run() = 0;

  virtual RetryConstraint should_re_run_on_failure(const std::string& error, int run_count,
                                                   int retry_limit);

private:
  JobId id_;
  std::optional<std::string> group_id_;
  bool requires_network_;
  std::optional<TagSet> tags_;
  std::chrono::milliseconds delay_;
  int retry_limit_;

  std::atomic<int> priority_;
  std::atomic<bool> cancelled_{false};

  std::optional<RetryConstraint> retry_constraint_;
  JobContext ctx_{};
};

// Job whose body is a callable.
class FunctionJob : public Job {
public:
  using Fn = std::function<JobResult()>;
  using RetryFn = std::function<RetryConstraint(const std::string& error, int run_count, int retry_limit)>;

  FunctionJob(JobParams params, Fn fn, RetryFn retry = {});

protected:
  JobResult on_run() override;
  RetryConstraint should_re_run_on_failure(const std::string& error, int run_count,
                                           int retry_limit) override;

private:
  Fn fn_;
  RetryFn retry_;
};

} // namespace jobqueue
