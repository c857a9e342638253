#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "jobqueue/job.h"
#include "jobqueue/job_record.h"

namespace jobqueue_test {

using namespace jobqueue;

inline JobParams make_params(std::string id, int priority = 0) {
  JobParams p;
  p.id = std::move(id);
  p.priority = priority;
  return p;
}

// Thread-safe list of job ids in the order they ran.
class Trace {
public:
  void add(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    ids_.push_back(id);
  }

  std::vector<std::string> ids() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return ids_;
  }

private:
  mutable std::mutex mtx_;
  std::vector<std::string> ids_;
};

// Returns scripted outcomes from safe_run; the last one repeats.
class ScriptedJob : public Job {
public:
  explicit ScriptedJob(JobParams params, std::vector<RunResult> script = {RunResult::Success},
                       Trace* trace = nullptr)
      : Job(std::move(params)), script_(std::move(script)), trace_(trace) {}

  RunResult safe_run(JobRecord&, int current_run_count) noexcept override {
    const int n = runs_.fetch_add(1);
    last_run_count_.store(current_run_count);
    if (trace_) trace_->add(id());
    const auto idx = static_cast<std::size_t>(n) < script_.size() ? static_cast<std::size_t>(n)
                                                                   : script_.size() - 1;
    return script_[idx];
  }

  bool requires_network() const override { return network_.load(); }
  void set_requires_network(bool on) { network_.store(on); }

  const TagSet* tags() const override { return tags_ ? &*tags_ : nullptr; }
  void set_tags(std::optional<TagSet> tags) { tags_ = std::move(tags); }

  void on_added() override { added_++; }
  void on_cancel() override { cancel_calls_++; }

  int runs() const { return runs_.load(); }
  int last_run_count() const { return last_run_count_.load(); }
  int added() const { return added_.load(); }
  int cancel_calls() const { return cancel_calls_.load(); }

protected:
  JobResult on_run() override { return JobResult::Success(); }

private:
  std::vector<RunResult> script_;
  Trace* trace_;
  std::atomic<int> runs_{0};
  std::atomic<int> last_run_count_{0};
  std::atomic<int> added_{0};
  std::atomic<int> cancel_calls_{0};
  std::atomic<bool> network_{false};
  std::optional<TagSet> tags_;
};

// FunctionJob that counts cancellation notifications.
class CountingJob : public FunctionJob {
public:
  using FunctionJob::FunctionJob;

  void on_cancel() override { cancel_calls_++; }
  int cancel_calls() const { return cancel_calls_.load(); }

private:
  std::atomic<int> cancel_calls_{0};
};

inline std::shared_ptr<JobRecord> make_record(std::shared_ptr<Job> job, int priority,
                                              TimeNs created_ns,
                                              std::optional<std::uint64_t> insertion_order = std::nullopt) {
  JobRecord::Builder b;
  b.job(std::move(job)).priority(priority).running_session_id(1).created_ns(created_ns);
  if (insertion_order) b.insertion_order(*insertion_order);
  return b.build();
}

} // namespace jobqueue_test
