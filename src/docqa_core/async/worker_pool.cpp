#include "docqa_core/async/worker_pool.hpp"

#include <iostream>

namespace docqa_core::async {

WorkerPool::WorkerPool(size_t num_threads, std::string name) : name_(std::move(name)) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(std::make_unique<Worker>(static_cast<int>(i), queue_));
  }
  for (const auto& worker : workers_) {
    worker->start();
  }
  std::cout << "[" << name_ << "] Started with " << num_threads << " workers." << std::endl;
}

WorkerPool::~WorkerPool() {
  shutdown();
  // Worker destructors join the threads
  workers_.clear();
}

void WorkerPool::shutdown() {
  queue_.close();
}

}  // namespace docqa_core::async
