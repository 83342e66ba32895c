#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>
#include <vector>

#include "docqa_core/async/cancellation_token.hpp"
#include "docqa_core/async/worker_pool.hpp"

namespace docqa_tests {

using namespace docqa_core::async;

TEST(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0); }, std::invalid_argument);
}

TEST(WorkerPoolTest, StartAndDestroyWithoutTasks) {
  EXPECT_NO_THROW({
    WorkerPool pool(2, "IdlePool");
    EXPECT_EQ(pool.size(), 2u);
    // Destructor closes the queue and joins
  });
}

TEST(WorkerPoolTest, SubmitReturnsResultThroughFuture) {
  WorkerPool pool(2);
  auto future = pool.submit([] { return 6 * 7; });
  EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, TaskExceptionIsDeliveredThroughFuture) {
  WorkerPool pool(1);
  auto future = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
  EXPECT_THROW(future.get(), std::runtime_error);

  // The worker survives and keeps serving
  EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, TasksRunConcurrently) {
  WorkerPool pool(4);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  std::vector<std::future<void>> futures;
  for (int i = 0; i < 4; ++i) {
    futures.push_back(pool.submit([&]() {
      int now = ++running;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      --running;
    }));
  }
  for (auto& f : futures) {
    f.get();
  }
  EXPECT_GT(peak.load(), 1);
}

TEST(WorkerPoolTest, SubmitAfterShutdownThrows) {
  WorkerPool pool(1, "ClosedPool");
  pool.shutdown();
  EXPECT_THROW(pool.submit([] { return 0; }), std::runtime_error);
}

TEST(WorkerPoolTest, QueuedTasksAreDroppedAtShutdown) {
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::future<int> queued;
  {
    WorkerPool pool(1);
    pool.submit([gate] { gate.wait(); });
    queued = pool.submit([] { return 1; });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pool.shutdown();
    release.set_value();
  }
  EXPECT_THROW(queued.get(), std::future_error);
}

TEST(TaskQueueTest, PopReturnsNulloptOnceClosed) {
  TaskQueue queue;
  int ran = 0;
  EXPECT_TRUE(queue.push([&ran] { ++ran; }));
  EXPECT_EQ(queue.pending(), 1u);

  auto task = queue.pop();
  ASSERT_TRUE(task.has_value());
  (*task)();
  EXPECT_EQ(ran, 1);

  queue.close();
  EXPECT_FALSE(queue.push([] {}));
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(CancellationTokenTest, CopiesShareTheFlag) {
  CancellationToken token;
  CancellationToken copy = token;
  EXPECT_FALSE(copy.is_cancelled());
  EXPECT_NO_THROW(throw_if_cancelled(copy));

  token.cancel();
  EXPECT_TRUE(copy.is_cancelled());
  EXPECT_THROW(throw_if_cancelled(copy), TaskCancelled);
}

TEST(CancellationTokenTest, WaitTimesOutWhenNotCancelled) {
  CancellationToken token;
  const auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.wait_for(std::chrono::milliseconds(20)));
  EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(20));
}

TEST(CancellationTokenTest, CancelWakesWaiters) {
  CancellationToken token;
  std::thread canceller([token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    token.cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.wait_for(std::chrono::seconds(10)));
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
  canceller.join();

  // Already cancelled: returns at once
  EXPECT_TRUE(token.wait_for(std::chrono::seconds(10)));
}

}  // namespace docqa_tests
