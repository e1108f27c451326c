#ifndef SHIELD_THREAD_POOL_H_
#define SHIELD_THREAD_POOL_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace shield {

struct TaskMetrics {
  std::atomic<uint64_t> tasks_submitted{0};
  std::atomic<uint64_t> tasks_completed{0};
  std::atomic<uint64_t> total_wait_time_us{0};
  std::atomic<uint64_t> total_exec_time_us{0};
  std::atomic<uint32_t> active_workers{0};
  std::atomic<uint32_t> idle_workers{0};
  std::atomic<uint32_t> queue_depth{0};
};

/**
 * Fixed-size FIFO worker pool used for batch detection.
 * Detection is CPU bound, so the default size is one worker per hardware
 * thread.
 */
class ThreadPool {
public:
  // If num_threads = 0, uses hardware_concurrency (at least 1)
  explicit ThreadPool(size_t num_threads = 0);
  ~ThreadPool();

  // Non-copyable, non-movable
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // Queue a task; its result (or exception) is delivered through the future.
  // After Shutdown() the task is dropped and get() reports broken_promise.
  template<typename F, typename... Args>
  auto Submit(F&& f, Args&&... args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  // Drain the queue and join all workers
  void Shutdown();

  const TaskMetrics& GetMetrics() const { return metrics_; }

  size_t GetWorkerCount() const { return worker_count_; }
  size_t GetQueueSize() const;
  bool IsShutdown() const { return shutdown_.load(std::memory_order_acquire); }

private:
  struct Task {
    std::function<void()> func;
    std::chrono::steady_clock::time_point submitted;
  };

  void WorkerLoop();

  std::vector<std::thread> workers_;
  size_t worker_count_ = 0;

  std::queue<Task> queue_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  std::atomic<bool> shutdown_{false};

  TaskMetrics metrics_;
};

// ============================================================
// Template Implementations
// ============================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...)
  );

  std::future<return_type> result = task->get_future();

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
      return result;
    }

    Task t;
    t.func = [task]() { (*task)(); };
    t.submitted = std::chrono::steady_clock::now();

    queue_.push(std::move(t));
    metrics_.tasks_submitted.fetch_add(1, std::memory_order_relaxed);
    metrics_.queue_depth.fetch_add(1, std::memory_order_relaxed);
  }

  queue_cv_.notify_one();
  return result;
}

}  // namespace shield

#endif  // SHIELD_THREAD_POOL_H_
