#pragma once

#include <mutex>
#include <vector>

#include "mtz/file_record.hpp"
#include "mtz/job.hpp"
#include "mtz/types.hpp"

namespace mtz {

// Jobs registered since the last compression pass. Safe to use from several
// threads.
class JobQueue {
 public:
  JobQueue() = default;
  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;

  void push(Job job);

  [[nodiscard]] size_t size() const;
  [[nodiscard]] bool empty() const;

  // Take every queued job at once. Jobs pushed afterwards belong to the next
  // batch.
  std::vector<Job> drain();

 private:
  mutable std::mutex m_mutex;
  std::vector<Job> m_jobs;
};

// A fixed number of threads turning one batch of jobs into file records.
//
// Workers pop jobs from the shared batch under a lock and compress them
// without holding it. The order of the returned records is unspecified.
class WorkerPool {
 public:
  WorkerPool() = delete;
  // A thread count of zero is treated as one.
  WorkerPool(size_t thread_cnt, FailurePolicy policy);

  // Process every job of the batch exactly once.
  // With FailurePolicy::abort_pass the first failure stops the workers from
  // taking further jobs, all records of the batch are dropped and the failure
  // is rethrown. With FailurePolicy::skip_entry failing jobs are logged and
  // left out.
  std::vector<FileRecord> run(std::vector<Job> batch) const;

  [[nodiscard]] size_t get_thread_cnt() const { return m_thread_cnt; }

 private:
  size_t m_thread_cnt;
  FailurePolicy m_policy;
};

}  // namespace mtz
