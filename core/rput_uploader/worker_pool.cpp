// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "worker_pool.hpp"

#include <exception>

#include "put_settings.hpp"

#define RPUT_LOG_COMPONENT "worker_pool"
#include <rput_log_macros.hpp>

namespace rput {
namespace uploader {

using logging::kv;

WorkerPool::WorkerPool(int num_workers, size_t queue_capacity)
    : capacity_(queue_capacity > 0 ? queue_capacity : 1) {
  if (num_workers < 1) {
    RPUT_LOG_WARN("Invalid worker count, using 1" << kv("requested", num_workers));
    num_workers = 1;
  }

  workers_.reserve(num_workers);
  for (int i = 0; i < num_workers; ++i) {
    workers_.emplace_back(&WorkerPool::workerLoop, this, i);
  }

  RPUT_LOG_DEBUG("Worker pool started" << kv("workers", num_workers) << kv("capacity", capacity_));
}

WorkerPool::~WorkerPool() {
  shutdown();
}

bool WorkerPool::submit(Task task) {
  std::unique_lock<std::mutex> lock(mutex_);

  not_full_.wait(lock, [this] { return shutdown_ || tasks_.size() < capacity_; });
  if (shutdown_) {
    return false;
  }

  tasks_.push(std::move(task));
  not_empty_.notify_one();
  return true;
}

void WorkerPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_.exchange(true)) {
      return;
    }
  }
  not_empty_.notify_all();
  not_full_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

bool WorkerPool::is_shutdown() const {
  return shutdown_.load();
}

size_t WorkerPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void WorkerPool::workerLoop(int worker_id) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      not_empty_.wait(lock, [this] { return shutdown_ || !tasks_.empty(); });

      // Queued tasks are never dropped, even during shutdown
      if (tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }
    not_full_.notify_one();

    try {
      task();
    } catch (const std::exception& e) {
      RPUT_LOG_ERROR("Task threw an exception" << kv("worker", worker_id) << kv("what", e.what()));
    }
  }
}

WorkerPool& defaultWorkerPool() {
  static std::once_flag once;
  static WorkerPool* pool = nullptr;

  std::call_once(once, [] {
    Settings s = settings();
    // Intentionally leaked: tasks may still run on it during static destruction
    pool = new WorkerPool(s.workers, static_cast<size_t>(s.task_queue_size));
  });
  return *pool;
}

}  // namespace uploader
}  // namespace rput
