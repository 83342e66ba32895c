#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace docqa_api {

struct ServerOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8000;
  // Crow handler threads; 0 means one per hardware thread
  unsigned int threads = 0;
  // Idle/read timeout of a client connection. Must outlast the slowest /hackrx/run request.
  std::uint8_t timeout_seconds = 60;
};

/**
 * @brief Owns the Crow application and runs it on a background thread.
 *
 * start() throws when the listener fails to come up; stop() closes the listener and
 * joins the run thread. The destructor stops a running server.
 */
class Server {
 public:
  explicit Server(ServerOptions options);
  ~Server();

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }
  const ServerOptions &options() const {
    return options_;
  }

  void start();
  void stop();

  bool is_running() const {
    return running_;
  }

  static unsigned int resolve_threads(unsigned int requested);

 private:
  crow::SimpleApp app_;
  ServerOptions options_;
  std::future<void> run_future_;
  bool running_ = false;
};

}  // namespace docqa_api
