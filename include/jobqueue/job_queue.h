#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "jobqueue/job_record.h"
#include "jobqueue/types.h"

namespace jobqueue {

// Records waiting to run, kept in RunsBefore order. A queued record's
// priority and created_ns must not change while it is queued.
class JobQueue {
public:
  JobQueue() = default;
  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;

  // Push a record into the queue. Assigns the next insertion order if the
  // record has none yet.
  // Returns false if the queue is closed or already holds a record with the
  // same id (record not accepted).
  bool push(std::shared_ptr<JobRecord> record);

  // Removes and returns the first record in run order that:
  // 1) is not delayed past now_ns
  // 2) does not need the network while it is unavailable
  // 3) is not in one of running_groups
  // Returns nullptr if no record qualifies.
  std::shared_ptr<JobRecord> next_ready(TimeNs now_ns, bool network_available,
                                        const std::set<std::string>& running_groups);

  // Earliest delay_until_ns among records held back only by their delay, or
  // kNotDelayedJobDelay if there are none.
  TimeNs next_ready_time(TimeNs now_ns, bool network_available,
                         const std::set<std::string>& running_groups) const;

  std::shared_ptr<JobRecord> remove(const JobId& id);
  std::shared_ptr<JobRecord> find(const JobId& id) const;

  // Pushes back every queued record of the group to at least until_ns.
  void delay_group(const std::string& group_id, TimeNs until_ns);

  // Close queue: stops further pushes.
  void close();

  bool is_closed() const;
  std::size_t size() const;

  // Queued records in run order.
  std::vector<std::shared_ptr<JobRecord>> snapshot() const;

private:
  // RunsBefore, with the id breaking full ties so the set never drops a
  // record. Only recovered records can collide on insertion order.
  struct QueueOrder {
    bool operator()(const std::shared_ptr<JobRecord>& a, const std::shared_ptr<JobRecord>& b) const {
      const int c = compare_for_run(*a, *b);
      if (c != 0) return c < 0;
      return a->id() < b->id();
    }
  };

  static bool is_runnable_(const JobRecord& r, TimeNs now_ns, bool network_available,
                           const std::set<std::string>& running_groups);

  static std::uint64_t next_insertion_order_();

  mutable std::mutex mtx_;
  std::set<std::shared_ptr<JobRecord>, QueueOrder> ordered_;
  std::unordered_map<JobId, std::shared_ptr<JobRecord>> by_id_;
  bool closed_{false};
};

} // namespace jobqueue
