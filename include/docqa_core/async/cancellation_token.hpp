#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace docqa_core::async {

/**
 * @brief Shared flag used to ask running tasks to stop early.
 *
 * Copies observe the same flag. Cancellation is cooperative: tasks poll
 * is_cancelled() between stages and nothing is interrupted mid-call. Tasks that
 * need to pause (retry backoff) wait on the token so cancel() wakes them.
 */
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void cancel() const {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled.store(true);
    }
    state_->cv.notify_all();
  }

  bool is_cancelled() const {
    return state_->cancelled.load();
  }

  // Blocks for up to `timeout`; true when the token was (or becomes) cancelled
  bool wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled.load(); });
  }

 private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
  };

  std::shared_ptr<State> state_;
};

class TaskCancelled : public std::exception {
 public:
  const char* what() const noexcept override {
    return "Task cancelled";
  }
};

inline void throw_if_cancelled(const CancellationToken& token) {
  if (token.is_cancelled()) {
    throw TaskCancelled();
  }
}

}  // namespace docqa_core::async
