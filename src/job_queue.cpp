#include "jobqueue/job_queue.h"

#include <atomic>
#include <utility>

namespace jobqueue {

std::uint64_t JobQueue::next_insertion_order_() {
  // shared by every queue so orders never repeat within the process
  static std::atomic<std::uint64_t> counter{1};
  return counter.fetch_add(1);
}

bool JobQueue::is_runnable_(const JobRecord& r, TimeNs now_ns, bool network_available,
                            const std::set<std::string>& running_groups) {
  if (r.is_delayed() && r.delay_until_ns() > now_ns) return false;
  if (r.requires_network() && !network_available) return false;
  if (r.group_id() && running_groups.count(*r.group_id()) > 0) return false;
  return true;
}

bool JobQueue::push(std::shared_ptr<JobRecord> record) {
  if (!record) return false;

  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) return false;
  if (by_id_.count(record->id()) > 0) return false;

  if (!record->insertion_order()) record->set_insertion_order(next_insertion_order_());

  by_id_.emplace(record->id(), record);
  ordered_.insert(std::move(record));
  return true;
}

std::shared_ptr<JobRecord> JobQueue::next_ready(TimeNs now_ns, bool network_available,
                                                const std::set<std::string>& running_groups) {
  std::lock_guard<std::mutex> lock(mtx_);

  for (auto it = ordered_.begin(); it != ordered_.end(); ++it) {
    if (!is_runnable_(**it, now_ns, network_available, running_groups)) continue;

    auto record = *it;
    ordered_.erase(it);
    by_id_.erase(record->id());
    return record;
  }
  return {};
}

TimeNs JobQueue::next_ready_time(TimeNs now_ns, bool network_available,
                                 const std::set<std::string>& running_groups) const {
  std::lock_guard<std::mutex> lock(mtx_);

  TimeNs earliest = kNotDelayedJobDelay;
  for (const auto& r : ordered_) {
    if (!r->is_delayed() || r->delay_until_ns() <= now_ns) continue;
    if (r->requires_network() && !network_available) continue;
    if (r->group_id() && running_groups.count(*r->group_id()) > 0) continue;

    if (earliest == kNotDelayedJobDelay || r->delay_until_ns() < earliest) {
      earliest = r->delay_until_ns();
    }
  }
  return earliest;
}

std::shared_ptr<JobRecord> JobQueue::remove(const JobId& id) {
  std::lock_guard<std::mutex> lock(mtx_);

  auto it = by_id_.find(id);
  if (it == by_id_.end()) return {};

  auto record = it->second;
  by_id_.erase(it);
  ordered_.erase(record);
  return record;
}

std::shared_ptr<JobRecord> JobQueue::find(const JobId& id) const {
  std::lock_guard<std::mutex> lock(mtx_);

  auto it = by_id_.find(id);
  if (it == by_id_.end()) return {};
  return it->second;
}

void JobQueue::delay_group(const std::string& group_id, TimeNs until_ns) {
  std::lock_guard<std::mutex> lock(mtx_);

  // delay is not part of the ordering key, so records stay where they are
  for (const auto& r : ordered_) {
    if (!r->group_id() || *r->group_id() != group_id) continue;
    if (!r->is_delayed() || r->delay_until_ns() < until_ns) r->set_delay_until_ns(until_ns);
  }
}

void JobQueue::close() {
  std::lock_guard<std::mutex> lock(mtx_);
  closed_ = true;
}

bool JobQueue::is_closed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closed_;
}

std::size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return ordered_.size();
}

std::vector<std::shared_ptr<JobRecord>> JobQueue::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return std::vector<std::shared_ptr<JobRecord>>(ordered_.begin(), ordered_.end());
}

} // namespace jobqueue
