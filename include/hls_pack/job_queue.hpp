/**
 * @file job_queue.hpp
 * @brief Thread-safe encoder job queue for the worker pool
 *
 * @details Producer-consumer queue between the converter and its workers:
 *
 *          - The converter (producer) pushes every job of a file
 *
 *          - Workers (consumers) pop and run one job at a time
 *
 *          - Each job carries its slot so results keep discovery order
 */

#ifndef HLS_PACK_JOB_QUEUE_HPP
#define HLS_PACK_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "types.hpp"

namespace hls_pack {

/**
 * @struct QueuedJob
 * @brief A job and the result slot it fills.
 */
struct QueuedJob {
  size_t slot; //< Position in discovery order
  Job job;
};

/**
 * @class JobQueue
 * @brief Thread-safe queue for encoder jobs (producer-consumer pattern).
 *
 * @attention USAGE:
 *
 *   - The converter calls push() for every job
 *
 *   - Workers call pop() in a loop
 *
 *   - Call finish() once all jobs are pushed
 */
class JobQueue {
public:
  /**
   * @brief Push a job to the queue.
   * @param job The job and its slot
   */
  void push(QueuedJob job);

  /**
   * @brief Pop a job from the queue (blocking).
   * @param job Output: the job to execute
   * @return true if job was retrieved, false if queue is finished
   */
  bool pop(QueuedJob &job);

  /**
   * @brief Signal that no more jobs will be pushed.
   */
  void finish();

  /**
   * @brief Check if queue is empty.
   */
  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<QueuedJob> jobs_;
  std::atomic<bool> done_{false};
};

} // namespace hls_pack

#endif // HLS_PACK_JOB_QUEUE_HPP
