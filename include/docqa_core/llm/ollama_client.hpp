#pragma once

#include <string>
#include <vector>

#include "docqa_core/llm/model_clients.hpp"

namespace docqa_core {

// Talks to an Ollama server for both embeddings and text generation
class OllamaClient : public EmbeddingClient, public TextGenerationClient {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;
  std::string generate(const GenerationRequest &request) override;

  bool is_server_available();
  const std::string &model() const {
    return model_;
  }

 private:
  std::string ollama_url_;
  std::string model_;

  void setup_server_connection();
  [[noreturn]] void rethrow_model_error(const std::string &operation, const std::string &message);
};

}  // namespace docqa_core
