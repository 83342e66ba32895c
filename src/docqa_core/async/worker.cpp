#include "docqa_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

namespace docqa_core::async {

Worker::Worker(int worker_id, TaskQueue& queue) : worker_id_(worker_id), queue_(queue) {}

Worker::~Worker() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::run_loop() {
  while (auto task = queue_.pop()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      // Submitted tasks report through their futures; this only catches wrapper failures
      std::cerr << "Worker [" << worker_id_ << "] ERROR running task: " << e.what() << std::endl;
    }
  }
}

}  // namespace docqa_core::async
