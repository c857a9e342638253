#include "jobqueue/job_record.h"

#include <stdexcept>
#include <utility>

namespace jobqueue {

JobRecord::JobRecord(int priority, std::optional<std::string> group_id, int run_count,
                     std::shared_ptr<Job> job, TimeNs created_ns, TimeNs delay_until_ns,
                     SessionId running_session_id)
    : id_(job->id()),
      priority_(priority),
      group_id_(std::move(group_id)),
      run_count_(run_count),
      created_ns_(created_ns),
      delay_until_ns_(delay_until_ns),
      running_session_id_(running_session_id),
      requires_network_(job->requires_network()),
      job_(std::move(job)) {
  job_->set_priority(priority_);

  const TagSet* tags = job_->tags();
  if (tags) tags_ = std::make_shared<const TagSet>(*tags);
}

RunResult JobRecord::safe_run(int current_run_count) noexcept {
  return job_->safe_run(*this, current_run_count);
}

void JobRecord::set_priority(int priority) {
  priority_ = priority;
  job_->set_priority(priority);
}

void JobRecord::set_insertion_order(std::uint64_t insertion_order) {
  if (insertion_order_) {
    throw std::logic_error("insertion order already assigned for job " + id_);
  }
  insertion_order_ = insertion_order;
}

void JobRecord::set_job(std::shared_ptr<Job> job) {
  if (!job) throw std::invalid_argument("must provide a job");
  job_ = std::move(job);
  id_ = job_->id();
  job_->set_priority(priority_);
}

void JobRecord::mark_as_cancelled() {
  cancelled_.store(true);
  job_->mark_cancelled();
}

void JobRecord::on_cancel() {
  if (cancel_notified_.exchange(true)) return;
  job_->on_cancel();
}

// Builder

JobRecord::Builder& JobRecord::Builder::job(std::shared_ptr<Job> job) {
  job_ = std::move(job);
  return *this;
}

JobRecord::Builder& JobRecord::Builder::priority(int priority) {
  priority_ = priority;
  return *this;
}

JobRecord::Builder& JobRecord::Builder::group_id(std::optional<std::string> group_id) {
  group_id_ = std::move(group_id);
  return *this;
}

JobRecord::Builder& JobRecord::Builder::run_count(int run_count) {
  run_count_ = run_count;
  return *this;
}

JobRecord::Builder& JobRecord::Builder::created_ns(TimeNs created_ns) {
  created_ns_ = created_ns;
  return *this;
}

JobRecord::Builder& JobRecord::Builder::delay_until_ns(TimeNs delay_until_ns) {
  delay_until_ns_ = delay_until_ns;
  return *this;
}

JobRecord::Builder& JobRecord::Builder::insertion_order(std::uint64_t insertion_order) {
  insertion_order_ = insertion_order;
  return *this;
}

JobRecord::Builder& JobRecord::Builder::running_session_id(SessionId session_id) {
  running_session_id_ = session_id;
  return *this;
}

std::shared_ptr<JobRecord> JobRecord::Builder::build() const {
  if (!job_) throw std::invalid_argument("must provide a job");
  if (!priority_) throw std::invalid_argument("must provide a priority");
  if (!running_session_id_) throw std::invalid_argument("must provide a session id");
  if (!created_ns_) throw std::invalid_argument("must provide a created timestamp");
  if (run_count_ < 0) throw std::invalid_argument("run count must not be negative");

  std::shared_ptr<JobRecord> record(new JobRecord(*priority_, group_id_, run_count_, job_,
                                                  *created_ns_, delay_until_ns_,
                                                  *running_session_id_));
  if (insertion_order_) record->set_insertion_order(*insertion_order_);
  return record;
}

// Ordering

int compare_for_run(const JobRecord& a, const JobRecord& b) {
  if (a.priority() != b.priority()) return a.priority() > b.priority() ? -1 : 1;
  if (a.created_ns() != b.created_ns()) return a.created_ns() < b.created_ns() ? -1 : 1;

  const auto& ia = a.insertion_order();
  const auto& ib = b.insertion_order();
  if (!ia || !ib) {
    throw std::logic_error("cannot order jobs " + a.id() + " and " + b.id() +
                           " without an insertion order");
  }
  if (*ia == *ib) return 0;
  return *ia < *ib ? -1 : 1;
}

} // namespace jobqueue
