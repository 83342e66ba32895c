#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "server.hpp"

namespace docqa_core {
class DocumentQaService;
}  // namespace docqa_core

namespace docqa_api {

struct RunRequest {
  std::string document_url;
  std::vector<std::string> questions;
};

class RequestError : public std::exception {
 public:
  explicit RequestError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class Routes {
 public:
  // An empty bearer token disables authentication
  Routes(std::shared_ptr<docqa_core::DocumentQaService> qa_service, std::string bearer_token);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_run(const crow::request &req);

  bool is_authorized(const crow::request &req) const;

  // Parses {"documents": url, "questions": [...]}; throws RequestError when malformed
  static RunRequest parse_run_request(const std::string &body);

 private:
  std::shared_ptr<docqa_core::DocumentQaService> qa_service_;
  std::string bearer_token_;

  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace docqa_api
