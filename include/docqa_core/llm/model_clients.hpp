#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace docqa_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Raised when the model server refuses a call because of load; callers may retry
class RateLimitError : public OllamaError {
 public:
  explicit RateLimitError(const std::string &message) : OllamaError(message) {}
};

class RerankError : public std::exception {
 public:
  explicit RerankError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @brief Maps a batch of texts to vectors.
 *
 * Implementations return one vector per input text, in input order, or throw.
 */
class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) = 0;
};

struct GenerationRequest {
  std::string system_prompt;
  std::string prompt;
  // Ask the model for a JSON document instead of prose
  bool json_output = false;
  float temperature = 0.0f;
  int max_tokens = 300;
};

class TextGenerationClient {
 public:
  virtual ~TextGenerationClient() = default;
  virtual std::string generate(const GenerationRequest &request) = 0;
};

/**
 * @brief Cross-encoder style relevance model.
 *
 * Only the relative order of scores for one question is meaningful.
 */
class RelevanceScorer {
 public:
  virtual ~RelevanceScorer() = default;

  virtual float score(const std::string &question, const std::string &document) = 0;

  // Scores a whole candidate set; remote scorers override this to make one call
  virtual std::vector<float> score_all(const std::string &question,
                                       const std::vector<std::string> &documents) {
    std::vector<float> scores;
    scores.reserve(documents.size());
    for (const auto &doc : documents) {
      scores.push_back(score(question, doc));
    }
    return scores;
  }
};

}  // namespace docqa_core
