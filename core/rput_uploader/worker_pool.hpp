// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RPUT_WORKER_POOL_HPP
#define RPUT_WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace rput {
namespace uploader {

/**
 * Fixed-width thread pool draining a bounded FIFO task queue
 *
 * - Multiple producers (upload sessions) submitting block tasks
 * - num_workers consumers, each running one task at a time to completion
 * - submit() blocks while the queue is full, which is the only
 *   backpressure applied to callers
 *
 * Any number of sessions may share one pool; their tasks interleave in
 * submission order.
 */
class WorkerPool {
public:
  using Task = std::function<void()>;

  /**
   * Create a pool and start its workers
   *
   * @param num_workers Number of worker threads (at least 1)
   * @param queue_capacity Maximum number of queued, not yet running, tasks (at least 1)
   */
  WorkerPool(int num_workers, size_t queue_capacity);

  /**
   * Shuts the pool down; queued tasks still run before workers exit
   */
  ~WorkerPool();

  // Non-copyable, non-movable
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  /**
   * Queue a task, blocking while the queue is at capacity
   *
   * @return true if queued, false if the pool is shut down
   */
  bool submit(Task task);

  /**
   * Stop accepting tasks, let workers drain the queue and join them
   */
  void shutdown();

  bool is_shutdown() const;

  /**
   * Number of queued tasks not yet picked up by a worker
   */
  size_t size() const;

  size_t capacity() const {
    return capacity_;
  }

  int numWorkers() const {
    return static_cast<int>(workers_.size());
  }

private:
  void workerLoop(int worker_id);

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<Task> tasks_;
  size_t capacity_;

  std::vector<std::thread> workers_;
  std::atomic<bool> shutdown_{false};
};

/**
 * Shared process-wide pool, created on first use from the current settings().
 * Never torn down; settings changes after creation do not resize it.
 */
WorkerPool& defaultWorkerPool();

}  // namespace uploader
}  // namespace rput

#endif  // RPUT_WORKER_POOL_HPP
