#pragma once

#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "docqa_core/async/task_queue.hpp"
#include "docqa_core/async/worker.hpp"

namespace docqa_core::async {

/**
 * @class WorkerPool
 * @brief Fixed set of Worker threads fed from one queue.
 *
 * Threads start in the constructor and are joined in the destructor (RAII). Tasks
 * still queued at destruction are dropped; their futures report broken_promise.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads Number of worker threads; must be at least one.
   * @param name Label used in log lines.
   */
  explicit WorkerPool(size_t num_threads, std::string name = "WorkerPool");
  ~WorkerPool();

  /**
   * @brief Queues a callable and returns a future for its result.
   *
   * Exceptions thrown by the callable are delivered through the future.
   * @throws std::runtime_error if the pool is shutting down.
   */
  template <typename F>
  std::future<std::invoke_result_t<F>> submit(F&& fn) {
    using Result = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    std::future<Result> future = task->get_future();
    if (!queue_.push([task]() { (*task)(); })) {
      throw std::runtime_error(name_ + " is shutting down");
    }
    return future;
  }

  size_t size() const {
    return workers_.size();
  }

  // Closes the queue; running tasks finish, queued ones are dropped
  void shutdown();

  // --- Rule of Five: make the class non-copyable and non-movable ---
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::string name_;
  TaskQueue queue_;
  std::vector<std::unique_ptr<Worker>> workers_;
};

}  // namespace docqa_core::async
