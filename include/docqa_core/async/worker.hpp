#pragma once

#include <thread>

#include "docqa_core/async/task_queue.hpp"

namespace docqa_core::async {

/**
 * @class Worker
 * @brief One background thread executing tasks from a shared TaskQueue.
 *
 * Managed by a WorkerPool. Non-copyable and non-movable so the thread it owns
 * always has a single, clear owner.
 */
class Worker {
 public:
  Worker(int worker_id, TaskQueue& queue);

  /**
   * @brief Joins the thread. The queue must have been closed first, otherwise this
   * blocks until it is.
   */
  ~Worker();

  /**
   * @brief Starts the processing loop in a new thread.
   * @throws std::runtime_error if the worker is already running.
   */
  void start();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  TaskQueue& queue_;
  std::thread thread_;
};

}  // namespace docqa_core::async
