#include "docqa_api/server.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace docqa_api {

Server::Server(ServerOptions options) : options_(std::move(options)) {
  if (options_.port == 0) {
    throw std::invalid_argument("Server port must be set");
  }
  if (options_.timeout_seconds == 0) {
    throw std::invalid_argument("Server timeout must be at least one second");
  }
}

Server::~Server() {
  stop();
}

unsigned int Server::resolve_threads(unsigned int requested) {
  if (requested > 0) {
    return requested;
  }
  const unsigned int hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? hardware : 2;
}

void Server::start() {
  if (running_) {
    return;
  }
  const unsigned int threads = resolve_threads(options_.threads);
  app_.bindaddr(options_.host)
      .port(options_.port)
      .concurrency(threads)
      .timeout(options_.timeout_seconds)
      .server_name("DocQA");

  run_future_ = app_.run_async();
  // run() returns early when the listener cannot be bound
  if (run_future_.wait_for(std::chrono::milliseconds(200)) == std::future_status::ready) {
    const std::string where = options_.host + ":" + std::to_string(options_.port);
    try {
      run_future_.get();
    } catch (const std::exception &e) {
      throw std::runtime_error("Server failed to listen on " + where + ": " + e.what());
    }
    throw std::runtime_error("Server failed to listen on " + where);
  }
  running_ = true;
  std::cout << "[Server] Listening on " << options_.host << ":" << options_.port << " with "
            << threads << " threads" << std::endl;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (run_future_.valid()) {
    run_future_.get();
  }
  running_ = false;
  std::cout << "[Server] Stopped" << std::endl;
}

}  // namespace docqa_api
