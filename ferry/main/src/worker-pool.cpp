#include "ferry/worker-pool.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "ferry/log.hpp"

namespace ferry {

WorkerPool::WorkerPool(uint32_t nbThreads, uint32_t maxQueuedJobs)
    : _nbThreads(nbThreads), _maxQueuedJobs(maxQueuedJobs) {
  if (nbThreads == 0) {
    throw std::invalid_argument("WorkerPool needs at least one thread");
  }
  if (maxQueuedJobs == 0) {
    throw std::invalid_argument("WorkerPool queue capacity must be strictly positive");
  }
  _threads.reserve(nbThreads);
  for (uint32_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _threads.emplace_back([this] { workerLoop(); });
  }
  log::debug("Started worker pool with {} threads and a queue of {} jobs", nbThreads, maxQueuedJobs);
}

bool WorkerPool::tryPost(Job job) {
  {
    std::scoped_lock lock(_mutex);
    if (!_accepting || _queue.size() >= _maxQueuedJobs) {
      return false;
    }
    _queue.push_back(std::move(job));
  }
  _jobAvailable.notify_one();
  return true;
}

void WorkerPool::shutdown() {
  {
    std::scoped_lock lock(_mutex);
    if (!_accepting && _threads.empty()) {
      return;
    }
    _accepting = false;
  }
  _jobAvailable.notify_all();
  for (std::jthread &thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  std::scoped_lock lock(_mutex);
  _threads.clear();
  log::debug("Worker pool stopped");
}

std::size_t WorkerPool::nbQueuedJobs() const {
  std::scoped_lock lock(_mutex);
  return _queue.size();
}

bool WorkerPool::accepting() const {
  std::scoped_lock lock(_mutex);
  return _accepting;
}

void WorkerPool::workerLoop() {
  while (true) {
    Job job;
    {
      std::unique_lock lock(_mutex);
      _jobAvailable.wait(lock, [this] { return !_queue.empty() || !_accepting; });
      if (_queue.empty()) {
        return;
      }
      job = std::move(_queue.front());
      _queue.pop_front();
    }
    try {
      job();
    } catch (const std::exception &ex) {
      log::error("Worker job failed: {}", ex.what());
    }
  }
}

}  // namespace ferry
