#include "jobqueue/job_manager.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace jobqueue {

namespace {

ManagerConfig normalized(ManagerConfig config) {
  if (!config.clock) config.clock = steady_now_ns;
  return config;
}

} // namespace

ManagerConfig ManagerConfig::from_env() {
  ManagerConfig cfg;

  if (const char* level = std::getenv("JOBQUEUE_LOG_LEVEL")) {
    // unknown names keep the default
    if (auto parsed = parse_log_level(level)) cfg.log_level = *parsed;
  }
  if (const char* json = std::getenv("JOBQUEUE_JSON_LOGS")) {
    const std::string v(json);
    cfg.json_logs = (v == "1" || v == "true" || v == "on");
  }
  return cfg;
}

SessionId JobManager::next_session_id_(TimeNs now) {
  // strictly increasing even if two managers start within one clock tick
  static std::atomic<SessionId> last{0};

  SessionId prev = last.load();
  SessionId next = 0;
  do {
    next = std::max<SessionId>(now, prev + 1);
  } while (!last.compare_exchange_weak(prev, next));
  return next;
}

JobManager::JobManager(ManagerConfig config)
    : config_(normalized(std::move(config))),
      session_id_(next_session_id_(config_.clock())),
      network_available_(config_.network_available) {
  logger_.set_level(config_.log_level);
  logger_.set_json(config_.json_logs);
  logger_.info("job manager started", {{"session", std::to_string(session_id_)}});
}

JobManager::JobManager(ManagerConfig config, std::ostream& log_out)
    : config_(normalized(std::move(config))),
      logger_(log_out),
      session_id_(next_session_id_(config_.clock())),
      network_available_(config_.network_available) {
  logger_.set_level(config_.log_level);
  logger_.set_json(config_.json_logs);
  logger_.info("job manager started", {{"session", std::to_string(session_id_)}});
}

JobManager::~JobManager() {
  stop();
}

bool JobManager::add_job(std::shared_ptr<Job> job) {
  if (!job) throw std::invalid_argument("must provide a job");
  if (!accepting_.load()) return false;

  const auto delay = job->initial_delay();
  std::shared_ptr<JobRecord> record;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    // building the record writes to the job, so a running or queued job must
    // be turned away first
    if (running_.count(job->id()) > 0 || queue_.find(job->id())) return false;

    const TimeNs now = config_.clock();
    record = JobRecord::Builder()
                 .job(job)
                 .priority(job->priority())
                 .group_id(job->group_id())
                 .created_ns(now)
                 .delay_until_ns(delay_deadline(now, delay))
                 .running_session_id(session_id_)
                 .build();
    if (!queue_.push(record)) return false;
    record->set_context(JobContext{&logger_, session_id_});

    finished_.erase(record->id());
    stats_.jobs_added++;
  }

  logger_.info(ForJob{record->id()}, "added", {
    {"event", "job_added"},
    {"priority", std::to_string(record->priority())},
    {"group", record->group_id().value_or("")},
    {"delay_ms", std::to_string(delay.count())}
  });

  job->on_added();
  return true;
}

std::optional<RunResult> JobManager::run_next() {
  std::shared_ptr<JobRecord> record;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    record = queue_.next_ready(config_.clock(), network_available_.load(), running_groups_);
    if (!record) return std::nullopt;

    record->set_run_count(record->run_count() + 1);
    record->set_running_session_id(session_id_);

    running_[record->id()] = record;
    if (record->group_id()) running_groups_.insert(*record->group_id());
    if (record->run_count() > 1) stats_.retries_performed++;
  }

  const int attempt = record->run_count();
  const std::string attempt_s = std::to_string(attempt);

  logger_.info(ForJob{record->id()}, attempt > 1 ? "retrying" : "starting", {
    {"event", "job_start"},
    {"attempt", attempt_s},
    {"priority", std::to_string(record->priority())}
  });

  const auto t0 = std::chrono::steady_clock::now();
  const RunResult res = record->safe_run(attempt);
  const auto t1 = std::chrono::steady_clock::now();
  const auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0);

  Finished f;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    f = finish_attempt_(record, res);
  }

  const std::string dur_s = std::to_string(dur.count());
  if (f.requeued) {
    logger_.warn(ForJob{record->id()}, "retry_scheduled", {
      {"event", "job_retry"},
      {"attempt", attempt_s},
      {"result", to_string(res)},
      {"delay_ms", std::to_string(f.delay.count())}
    });
  } else if (f.status == JobStatus::Succeeded) {
    logger_.info(ForJob{record->id()}, "success", {
      {"event", "job_finish"},
      {"attempt", attempt_s},
      {"duration_ms", dur_s},
      {"state", to_string(f.status)}
    });
  } else {
    logger_.error(ForJob{record->id()}, f.status == JobStatus::Cancelled ? "cancelled" : "failed", {
      {"event", "job_finish"},
      {"attempt", attempt_s},
      {"duration_ms", dur_s},
      {"result", to_string(res)},
      {"state", to_string(f.status)}
    });
  }

  if (f.notify_cancel) record->on_cancel();
  return res;
}

std::size_t JobManager::run_until_idle() {
  std::size_t attempts = 0;
  while (run_next()) attempts++;
  return attempts;
}

JobManager::Finished JobManager::finish_attempt_(const std::shared_ptr<JobRecord>& record,
                                                 RunResult res) {
  running_.erase(record->id());
  if (record->group_id()) running_groups_.erase(*record->group_id());

  Finished f;
  switch (res) {
    case RunResult::Success:
      record->mark_as_successful();
      f.status = JobStatus::Succeeded;
      break;
    case RunResult::FailForCancel:
      f.status = JobStatus::Cancelled;
      f.notify_cancel = true;
      break;
    case RunResult::FailRunLimit:
      f.status = JobStatus::Failed;
      f.notify_cancel = true;
      break;
    case RunResult::TryAgain:
    case RunResult::FailShouldReRun: {
      const auto& constraint = record->retry_constraint();
      if (record->is_cancelled()) {
        f.status = JobStatus::Cancelled;
        f.notify_cancel = true;
        break;
      }
      if (res == RunResult::FailShouldReRun && constraint && !constraint->should_retry()) {
        f.status = JobStatus::Failed;
        f.notify_cancel = true;
        break;
      }

      const TimeNs now = config_.clock();
      auto next = rebuild_for_retry_(*record, now, f.delay);
      if (!accepting_.load() || !queue_.push(next)) {
        f.status = JobStatus::Failed;
        f.notify_cancel = true;
        break;
      }
      if (constraint && constraint->apply_delay_to_group() && next->group_id() && next->is_delayed()) {
        queue_.delay_group(*next->group_id(), next->delay_until_ns());
      }

      f.requeued = true;
      f.status = next->is_delayed() ? JobStatus::WaitingNotReady : JobStatus::WaitingReady;
      return f;
    }
  }

  if (f.status == JobStatus::Succeeded) stats_.jobs_succeeded++;
  else if (f.status == JobStatus::Cancelled) stats_.jobs_cancelled++;
  else stats_.jobs_failed++;

  finished_[record->id()] = f.status;
  return f;
}

std::shared_ptr<JobRecord> JobManager::rebuild_for_retry_(const JobRecord& record,
                                                          TimeNs now,
                                                          std::chrono::milliseconds& delay) const {
  const auto& constraint = record.retry_constraint();

  int priority = record.priority();
  if (constraint && constraint->new_priority()) priority = *constraint->new_priority();

  if (constraint && constraint->new_delay()) {
    delay = *constraint->new_delay();
  } else {
    delay = compute_backoff_delay(record.run_count(), config_.default_backoff,
                                  config_.default_backoff_base, config_.max_backoff);
  }

  // a fresh record, so the queue hands out a fresh insertion order
  return JobRecord::Builder()
      .job(record.job())
      .priority(priority)
      .group_id(record.group_id())
      .run_count(record.run_count())
      .created_ns(record.created_ns())
      .delay_until_ns(delay_deadline(now, delay))
      .running_session_id(session_id_)
      .build();
}

bool JobManager::cancel(const JobId& id) {
  std::shared_ptr<JobRecord> queued;
  {
    std::lock_guard<std::mutex> lock(mtx_);

    auto it = running_.find(id);
    if (it != running_.end()) {
      it->second->mark_as_cancelled();
    } else {
      queued = queue_.remove(id);
      if (!queued) return false;

      queued->mark_as_cancelled();
      finished_[id] = JobStatus::Cancelled;
      stats_.jobs_cancelled++;
    }
  }

  if (!queued) {
    // the running attempt observes the flag and finishes as cancelled
    logger_.warn(ForJob{id}, "cancel requested", {{"event", "job_cancel"}, {"state", "Running"}});
    return true;
  }

  logger_.warn(ForJob{id}, "cancelled", {{"event", "job_cancel"}, {"state", "Queued"}});
  queued->on_cancel();
  return true;
}

std::size_t JobManager::recover(const std::vector<std::shared_ptr<JobRecord>>& records) {
  std::size_t recovered = 0;

  for (const auto& r : records) {
    if (!r || r->is_cancelled()) continue;

    SessionId stale = 0;
    bool pushed = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      stale = r->running_session_id();
      if (stale == session_id_) continue;

      // a record whose job is running or queued here is left untouched
      if (accepting_.load() && running_.count(r->id()) == 0 && !queue_.find(r->id())) {
        r->set_running_session_id(session_id_);
        pushed = queue_.push(r);
        if (pushed) {
          r->set_context(JobContext{&logger_, session_id_});
          finished_.erase(r->id());
          stats_.jobs_recovered++;
        } else {
          r->set_running_session_id(stale);
        }
      }
    }

    if (!pushed) {
      logger_.warn(ForJob{r->id()}, "recovery skipped", {{"event", "job_recovered"}});
      continue;
    }

    logger_.info(ForJob{r->id()}, "recovered", {
      {"event", "job_recovered"},
      {"stale_session", std::to_string(stale)},
      {"run_count", std::to_string(r->run_count())}
    });
    recovered++;
  }
  return recovered;
}

void JobManager::set_network_available(bool available) {
  const bool was = network_available_.exchange(available);
  if (was != available) {
    logger_.info(available ? "network available" : "network lost");
  }
}

JobStatus JobManager::status(const JobId& id) const {
  std::lock_guard<std::mutex> lock(mtx_);

  if (running_.count(id) > 0) return JobStatus::Running;

  if (auto r = queue_.find(id)) {
    if (r->is_delayed() && r->delay_until_ns() > config_.clock()) return JobStatus::WaitingNotReady;
    if (r->requires_network() && !network_available_.load()) return JobStatus::WaitingNotReady;
    return JobStatus::WaitingReady;
  }

  auto it = finished_.find(id);
  if (it != finished_.end()) return it->second;
  return JobStatus::Unknown;
}

bool JobManager::is_successful(const JobId& id) const {
  return status(id) == JobStatus::Succeeded;
}

std::size_t JobManager::count() const {
  return queue_.size();
}

TimeNs JobManager::next_ready_time() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.next_ready_time(config_.clock(), network_available_.load(), running_groups_);
}

ManagerStats JobManager::stats() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return stats_;
}

void JobManager::stop() {
  if (!accepting_.exchange(false)) return;

  queue_.close();
  logger_.info("job manager stopped", {
    {"session", std::to_string(session_id_)},
    {"queued", std::to_string(queue_.size())}
  });
}

} // namespace jobqueue
