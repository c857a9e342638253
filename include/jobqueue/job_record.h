#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "jobqueue/job.h"
#include "jobqueue/result.h"
#include "jobqueue/retry_constraint.h"
#include "jobqueue/types.h"

namespace jobqueue {

// Wraps a Job with the metadata the queue orders and retries it by.
//
// run_count, delay_until_ns, insertion_order, running_session_id and priority
// are written by the owning manager only. cancelled and successful may be
// touched from any thread.
class JobRecord {
public:
  class Builder;

  JobRecord(const JobRecord&) = delete;
  JobRecord& operator=(const JobRecord&) = delete;

  // Runs one attempt on the calling thread. The code comes straight from the
  // job's safe_run().
  RunResult safe_run(int current_run_count) noexcept;

  const JobId& id() const { return id_; }
  bool requires_network() const { return requires_network_; }

  int priority() const { return priority_; }
  void set_priority(int priority);

  const std::optional<std::uint64_t>& insertion_order() const { return insertion_order_; }
  // Throws std::logic_error if an insertion order was already assigned.
  void set_insertion_order(std::uint64_t insertion_order);

  int run_count() const { return run_count_; }
  void set_run_count(int run_count) { run_count_ = run_count; }

  TimeNs created_ns() const { return created_ns_; }
  void set_created_ns(TimeNs created_ns) { created_ns_ = created_ns; }

  TimeNs delay_until_ns() const { return delay_until_ns_; }
  void set_delay_until_ns(TimeNs delay_until_ns) { delay_until_ns_ = delay_until_ns; }
  bool is_delayed() const { return delay_until_ns_ != kNotDelayedJobDelay; }

  SessionId running_session_id() const { return running_session_id_; }
  void set_running_session_id(SessionId session_id) { running_session_id_ = session_id; }

  const std::optional<std::string>& group_id() const { return group_id_; }

  // Snapshot taken at construction; nullptr if the job had no tags.
  const std::shared_ptr<const TagSet>& tags() const { return tags_; }
  bool has_tags() const { return tags_ && !tags_->empty(); }

  const std::shared_ptr<Job>& job() const { return job_; }
  // Swaps the wrapped job and re-derives the id. No other record field
  // changes; the new job takes the record's priority.
  void set_job(std::shared_ptr<Job> job);

  void mark_as_cancelled();
  bool is_cancelled() const { return cancelled_.load(); }

  // Notifies the job once. Later calls are no-ops.
  void on_cancel();

  void mark_as_successful() { successful_.store(true); }
  bool is_successful() const { return successful_.load(); }

  void set_context(JobContext ctx) { job_->set_context(ctx); }

  const std::optional<RetryConstraint>& retry_constraint() const { return job_->retry_constraint(); }

  friend bool operator==(const JobRecord& a, const JobRecord& b) { return a.id_ == b.id_; }
  friend bool operator!=(const JobRecord& a, const JobRecord& b) { return !(a == b); }

private:
  JobRecord(int priority, std::optional<std::string> group_id, int run_count,
            std::shared_ptr<Job> job, TimeNs created_ns, TimeNs delay_until_ns,
            SessionId running_session_id);

  JobId id_;
  int priority_;
  std::optional<std::string> group_id_;
  int run_count_;
  TimeNs created_ns_;
  TimeNs delay_until_ns_;
  SessionId running_session_id_;
  std::optional<std::uint64_t> insertion_order_;
  bool requires_network_;
  std::shared_ptr<const TagSet> tags_;
  std::shared_ptr<Job> job_;

  std::atomic<bool> cancelled_{false};
  std::atomic<bool> successful_{false};
  std::atomic<bool> cancel_notified_{false};
};

// Every required field must be set explicitly; zero is a valid value but
// "never set" is an error.
class JobRecord::Builder {
public:
  Builder& job(std::shared_ptr<Job> job);
  Builder& priority(int priority);
  Builder& group_id(std::optional<std::string> group_id);
  Builder& run_count(int run_count);
  Builder& created_ns(TimeNs created_ns);
  Builder& delay_until_ns(TimeNs delay_until_ns);
  Builder& insertion_order(std::uint64_t insertion_order);
  Builder& running_session_id(SessionId session_id);

  // Throws std::invalid_argument naming the first missing field.
  std::shared_ptr<JobRecord> build() const;

private:
  std::shared_ptr<Job> job_;
  std::optional<int> priority_;
  std::optional<std::string> group_id_;
  int run_count_{0};
  std::optional<TimeNs> created_ns_;
  TimeNs delay_until_ns_{kNotDelayedJobDelay};
  std::optional<std::uint64_t> insertion_order_;
  std::optional<SessionId> running_session_id_;
};

// Run order: higher priority first, then older created_ns, then lower
// insertion order. Negative when a runs before b, zero only for the same
// key. Throws std::logic_error if the insertion order is needed to break a
// tie and either record has none.
int compare_for_run(const JobRecord& a, const JobRecord& b);

struct RunsBefore {
  bool operator()(const JobRecord& a, const JobRecord& b) const { return compare_for_run(a, b) < 0; }
  bool operator()(const std::shared_ptr<JobRecord>& a, const std::shared_ptr<JobRecord>& b) const {
    return compare_for_run(*a, *b) < 0;
  }
};

struct JobRecordPtrHash {
  std::size_t operator()(const std::shared_ptr<JobRecord>& r) const {
    return std::hash<JobId>{}(r->id());
  }
};

struct JobRecordPtrEqual {
  bool operator()(const std::shared_ptr<JobRecord>& a, const std::shared_ptr<JobRecord>& b) const {
    return *a == *b;
  }
};

} // namespace jobqueue

namespace std {

template <>
struct hash<jobqueue::JobRecord> {
  size_t operator()(const jobqueue::JobRecord& r) const { return hash<jobqueue::JobId>{}(r.id()); }
};

} // namespace std
