#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace docqa_core::async {

using Task = std::function<void()>;

// Blocking FIFO shared by the workers of one pool
class TaskQueue {
 public:
  // Returns false once the queue is closed
  bool push(Task task) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_) {
        return false;
      }
      tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
  }

  // Blocks until a task is available; nullopt means the queue was closed
  std::optional<Task> pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return closed_ || !tasks_.empty(); });
    if (closed_) {
      return std::nullopt;
    }
    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    return task;
  }

  // Wakes every waiting worker; tasks not yet started are dropped
  void close() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
      tasks_.clear();
    }
    cv_.notify_all();
  }

  size_t pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_.size();
  }

 private:
  std::deque<Task> tasks_;
  bool closed_ = false;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace docqa_core::async
