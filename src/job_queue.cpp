/**
 * @file job_queue.cpp
 * @brief Encoder job queue implementation
 */

#include "hls_pack/job_queue.hpp"

namespace hls_pack {

void JobQueue::push(QueuedJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push(std::move(job));
  }
  cv_.notify_one();
}

bool JobQueue::pop(QueuedJob &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });

  if (jobs_.empty()) {
    return false;
  }

  job = std::move(jobs_.front());
  jobs_.pop();
  return true;
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

} // namespace hls_pack
