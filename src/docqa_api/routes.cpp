#include "docqa_api/routes.hpp"

#include <iostream>

#include "docqa_core/services/document_qa_service.hpp"

namespace docqa_api {
Routes::Routes(std::shared_ptr<docqa_core::DocumentQaService> qa_service, std::string bearer_token)
    : qa_service_(std::move(qa_service)), bearer_token_(std::move(bearer_token)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Document question answering endpoint
  CROW_ROUTE(app, "/hackrx/run").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_run(req);
  });
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response;
  response["status"] = "healthy";
  response["service"] = "DocQA API";
  return create_json_response(response);
}

bool Routes::is_authorized(const crow::request &req) const {
  if (bearer_token_.empty()) {
    return true;
  }
  const std::string header = req.get_header_value("Authorization");
  const std::string prefix = "Bearer ";
  return header.size() > prefix.size() && header.compare(0, prefix.size(), prefix) == 0 &&
         header.substr(prefix.size()) == bearer_token_;
}

RunRequest Routes::parse_run_request(const std::string &body) {
  nlohmann::json json_body = nlohmann::json::parse(body, nullptr, false);
  if (json_body.is_discarded() || !json_body.is_object()) {
    throw RequestError("Request body must be a JSON object");
  }
  if (!json_body.contains("documents") || !json_body["documents"].is_string()) {
    throw RequestError("'documents' must be a URL string");
  }
  if (!json_body.contains("questions") || !json_body["questions"].is_array()) {
    throw RequestError("'questions' must be an array of strings");
  }

  RunRequest request;
  request.document_url = json_body["documents"].get<std::string>();
  for (const auto &question : json_body["questions"]) {
    if (!question.is_string()) {
      throw RequestError("'questions' must be an array of strings");
    }
    request.questions.push_back(question.get<std::string>());
  }
  if (request.document_url.empty()) {
    throw RequestError("'documents' cannot be empty");
  }
  return request;
}

crow::response Routes::handle_run(const crow::request &req) {
  if (!is_authorized(req)) {
    return create_json_response(create_error_response("Invalid or missing bearer token"), 403);
  }

  RunRequest run_request;
  try {
    run_request = parse_run_request(req.body);
  } catch (const RequestError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  }

  std::cout << "Answering " << run_request.questions.size() << " questions for "
            << run_request.document_url << std::endl;
  try {
    std::vector<std::string> answers =
        qa_service_->run(run_request.document_url, run_request.questions);
    nlohmann::json response;
    response["answers"] = answers;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Request failed: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code,
                      json_data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

}  // namespace docqa_api
