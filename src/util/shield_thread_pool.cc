#include "util/shield_thread_pool.h"

#include <algorithm>

namespace shield {

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
  }

  worker_count_ = num_threads;
  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(&ThreadPool::WorkerLoop, this);
  }

  metrics_.idle_workers.store(static_cast<uint32_t>(num_threads), std::memory_order_relaxed);
}

ThreadPool::~ThreadPool() {
  Shutdown();
}

void ThreadPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return;  // Already shutdown
    }
    shutdown_.store(true, std::memory_order_release);
  }

  queue_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  workers_.clear();
}

size_t ThreadPool::GetQueueSize() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return queue_.size();
}

void ThreadPool::WorkerLoop() {
  while (true) {
    Task task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);

      // Wait for task or shutdown
      queue_cv_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) || !queue_.empty();
      });

      // Queued work is still drained after shutdown
      if (queue_.empty()) {
        return;
      }

      task = std::move(queue_.front());
      queue_.pop();
      metrics_.queue_depth.fetch_sub(1, std::memory_order_relaxed);
    }

    metrics_.active_workers.fetch_add(1, std::memory_order_relaxed);
    metrics_.idle_workers.fetch_sub(1, std::memory_order_relaxed);

    auto now = std::chrono::steady_clock::now();
    auto wait_us = std::chrono::duration_cast<std::chrono::microseconds>(
        now - task.submitted).count();
    metrics_.total_wait_time_us.fetch_add(wait_us, std::memory_order_relaxed);

    // packaged_task captures exceptions into the future
    task.func();
    metrics_.tasks_completed.fetch_add(1, std::memory_order_relaxed);

    auto exec_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - now).count();
    metrics_.total_exec_time_us.fetch_add(exec_us, std::memory_order_relaxed);

    metrics_.active_workers.fetch_sub(1, std::memory_order_relaxed);
    metrics_.idle_workers.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace shield
