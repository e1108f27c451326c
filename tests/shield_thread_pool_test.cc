#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/shield_thread_pool.h"

using namespace shield;

// ============================================================
// Basic Functionality Tests
// ============================================================

/**
 * @brief Test thread pool construction and basic properties
 */
TEST(ThreadPoolTest, Construction) {
  ThreadPool pool1;
  EXPECT_GE(pool1.GetWorkerCount(), 1u);
  EXPECT_FALSE(pool1.IsShutdown());
  EXPECT_EQ(pool1.GetQueueSize(), 0u);

  ThreadPool pool2(3);
  EXPECT_EQ(pool2.GetWorkerCount(), 3u);
}

/**
 * @brief Test task submission with arguments and return values
 */
TEST(ThreadPoolTest, SubmitReturnsResult) {
  ThreadPool pool(2);
  auto sum = pool.Submit([](int a, int b) { return a + b; }, 40, 2);
  auto text = pool.Submit([]() { return std::string("done"); });
  EXPECT_EQ(sum.get(), 42);
  EXPECT_EQ(text.get(), "done");
}

/**
 * @brief Exceptions thrown by a task reach the caller through the future
 */
TEST(ThreadPoolTest, ExceptionPropagates) {
  ThreadPool pool(1);
  auto future = pool.Submit([]() -> int { throw std::runtime_error("task failed"); });
  EXPECT_THROW(future.get(), std::runtime_error);

  // The worker survives
  EXPECT_EQ(pool.Submit([]() { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, ManyTasks) {
  ThreadPool pool(4);
  std::atomic<int> counter{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 200; ++i) {
    futures.push_back(pool.Submit([&counter]() { counter.fetch_add(1); }));
  }
  for (auto& f : futures) {
    f.get();
  }
  EXPECT_EQ(counter.load(), 200);

  // Joins the workers, so every completion has been counted
  pool.Shutdown();
  const TaskMetrics& metrics = pool.GetMetrics();
  EXPECT_EQ(metrics.tasks_submitted.load(), 200u);
  EXPECT_EQ(metrics.tasks_completed.load(), 200u);
  EXPECT_EQ(metrics.queue_depth.load(), 0u);
}

// ============================================================
// Shutdown
// ============================================================

TEST(ThreadPoolTest, ShutdownDrainsQueue) {
  std::atomic<int> counter{0};
  ThreadPool pool(1);
  for (int i = 0; i < 50; ++i) {
    pool.Submit([&counter]() { counter.fetch_add(1); });
  }
  pool.Shutdown();
  EXPECT_TRUE(pool.IsShutdown());
  EXPECT_EQ(counter.load(), 50);

  // Second call is a no-op
  pool.Shutdown();
}

TEST(ThreadPoolTest, SubmitAfterShutdown) {
  ThreadPool pool(1);
  pool.Shutdown();
  auto future = pool.Submit([]() { return 1; });
  EXPECT_THROW(future.get(), std::future_error);
  EXPECT_EQ(pool.GetMetrics().tasks_submitted.load(), 0u);
}
