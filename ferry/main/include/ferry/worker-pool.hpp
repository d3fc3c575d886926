#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "ferry/vector.hpp"

namespace ferry {

// Fixed set of worker threads consuming a bounded FIFO of jobs.
// One request is handled by one job, there is no coordination between jobs.
class WorkerPool {
 public:
  using Job = std::function<void()>;

  // Throws std::invalid_argument if 'nbThreads' or 'maxQueuedJobs' is 0.
  WorkerPool(uint32_t nbThreads, uint32_t maxQueuedJobs);

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool(WorkerPool &&) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;
  WorkerPool &operator=(WorkerPool &&) = delete;

  ~WorkerPool() { shutdown(); }

  // Enqueue 'job'. Returns false, without running it, if the queue is full or the pool is shut down.
  [[nodiscard]] bool tryPost(Job job);

  // Stop accepting jobs, run the already queued ones and join the workers. Idempotent.
  void shutdown();

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _nbThreads; }

  [[nodiscard]] std::size_t nbQueuedJobs() const;

  [[nodiscard]] bool accepting() const;

 private:
  void workerLoop();

  mutable std::mutex _mutex;
  std::condition_variable _jobAvailable;
  std::deque<Job> _queue;
  vector<std::jthread> _threads;
  std::size_t _nbThreads;
  std::size_t _maxQueuedJobs;
  bool _accepting{true};
};

}  // namespace ferry
