#include "mtz/job_queue.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "mtz/log.hpp"

namespace mtz {

namespace {

// Joins every started thread when leaving scope, also while unwinding.
class ThreadJoiner {
 public:
  explicit ThreadJoiner(std::vector<std::shared_ptr<std::thread>>& threads)
      : m_threads(threads) {}
  ThreadJoiner(const ThreadJoiner&) = delete;
  ThreadJoiner& operator=(const ThreadJoiner&) = delete;
  ~ThreadJoiner() {
    for (auto& thread : m_threads) {
      if (thread && thread->joinable()) {
        thread->join();
      }
    }
  }

 private:
  std::vector<std::shared_ptr<std::thread>>& m_threads;
};

}  // namespace

void JobQueue::push(Job job) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_jobs.push_back(std::move(job));
}

size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_jobs.size();
}

bool JobQueue::empty() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_jobs.empty();
}

std::vector<Job> JobQueue::drain() {
  std::vector<Job> batch;
  std::lock_guard<std::mutex> lock(m_mutex);
  batch.swap(m_jobs);
  return batch;
}

WorkerPool::WorkerPool(size_t thread_cnt, FailurePolicy policy)
    : m_thread_cnt(std::max<size_t>(thread_cnt, 1)), m_policy(policy) {}

std::vector<FileRecord> WorkerPool::run(std::vector<Job> batch) const {
  const size_t n_jobs = batch.size();
  if (n_jobs == 0) {
    return {};
  }
  const size_t thread_cnt = std::min(m_thread_cnt, n_jobs);
  log::log("compressing ", n_jobs, " job(s) with ", thread_cnt, " thread(s)");

  // Guards batch, first_error and aborted.
  std::mutex mutex;
  std::exception_ptr first_error;
  bool aborted = false;

  // Called with mutex held. Returns false if the worker must stop.
  auto on_failure = [this, &first_error, &aborted](const std::string& name,
                                                   const char* what) {
    if (m_policy == FailurePolicy::skip_entry) {
      log::warn("skipping '", name, "': ", what);
      return true;
    }
    if (!first_error) {
      first_error = std::current_exception();
    }
    aborted = true;
    return false;
  };

  auto work_thread = [&batch, &mutex, &aborted,
                      &on_failure](std::vector<FileRecord>& records) {
    while (true) {
      std::optional<Job> job;
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (aborted || batch.empty()) {
          break;
        }
        job.emplace(std::move(batch.back()));
        batch.pop_back();
      }

      const std::string name = job->get_archive_path();
      try {
        records.push_back(job->into_record());
      } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!on_failure(name, e.what())) {
          break;
        }
      } catch (...) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!on_failure(name, "unknown error")) {
          break;
        }
      }
    }
  };

  std::vector<std::vector<FileRecord>> results(thread_cnt);
  std::vector<std::shared_ptr<std::thread>> threads(thread_cnt);
  {
    ThreadJoiner joiner(threads);
    try {
      for (size_t i = 0; i < thread_cnt; ++i) {
        threads[i] =
            std::make_shared<std::thread>(work_thread, std::ref(results[i]));
      }
    } catch (...) {
      // Let the started workers finish early, the joiner waits for them.
      std::lock_guard<std::mutex> lock(mutex);
      aborted = true;
      throw;
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }

  std::vector<FileRecord> records;
  records.reserve(n_jobs);
  for (auto&& part : results) {
    std::move(part.begin(), part.end(), std::back_inserter(records));
  }
  log::log("compressed ", records.size(), " of ", n_jobs, " job(s)");
  return records;
}

}  // namespace mtz
