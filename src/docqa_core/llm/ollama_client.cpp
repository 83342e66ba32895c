#include "docqa_core/llm/ollama_client.hpp"

#include <algorithm>
#include <cctype>

#include "ollama.hpp"

namespace docqa_core {

OllamaClient::OllamaClient(const std::string &ollama_url, const std::string &model)
    : ollama_url_(ollama_url), model_(model) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(60);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + ollama_url_);
  }
}

void OllamaClient::rethrow_model_error(const std::string &operation, const std::string &message) {
  std::string lowered = message;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered.find("429") != std::string::npos || lowered.find("rate limit") != std::string::npos ||
      lowered.find("too many requests") != std::string::npos) {
    throw RateLimitError(operation + " rate limited: " + message);
  }
  throw OllamaError(operation + " failed: " + message);
}

// Ollama's /api/embed accepts a list as "input" and answers with one vector per entry
std::vector<std::vector<float>> OllamaClient::get_embeddings(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  try {
    ollama::request request = ollama::request::from_embedding(model_, texts.front());
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);
    auto json_response = response.as_json();

    if (json_response.contains("error")) {
      rethrow_model_error("Embedding generation", json_response["error"].dump());
    }
    if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
      throw OllamaError("Response does not contain embedding field");
    }

    const auto &embeddings = json_response["embeddings"];
    if (embeddings.size() != texts.size()) {
      throw OllamaError("Embedding count mismatch: sent " + std::to_string(texts.size()) +
                        ", received " + std::to_string(embeddings.size()));
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(embeddings.size());
    for (const auto &embedding : embeddings) {
      vectors.push_back(embedding.get<std::vector<float>>());
    }
    return vectors;
  } catch (const ollama::exception &e) {
    rethrow_model_error("Embedding generation", e.what());
  }
}

std::string OllamaClient::generate(const GenerationRequest &request) {
  try {
    ollama::options options;
    options["temperature"] = request.temperature;
    options["num_predict"] = request.max_tokens;

    ollama::request req(model_, request.prompt, options, false);
    if (!request.system_prompt.empty()) {
      req["system"] = request.system_prompt;
    }
    if (request.json_output) {
      req["format"] = "json";
    }

    ollama::response response = ollama::generate(req);
    auto json_response = response.as_json();
    if (json_response.contains("error")) {
      rethrow_model_error("Text generation", json_response["error"].dump());
    }
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    rethrow_model_error("Text generation", e.what());
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace docqa_core
